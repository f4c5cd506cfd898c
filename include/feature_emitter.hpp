#ifndef FEATURE_EMITTER_H
#define FEATURE_EMITTER_H

#include <optional>
#include <cstdint>
#include "history_store.hpp"
#include "stats_engine.hpp"
#include "window_record.hpp"

// Joins the history store and the statistics engine: every finalized window
// is pushed into history and, when the source is eligible, summarized into
// the feature vector handed to the scorer.
class FeatureEmitter {
public:
    FeatureEmitter(HistoryStore& history, const StatsEngine& stats)
        : history_(history), stats_(stats) {}

    // emitted_at is the stream time the finalization happened at
    [[nodiscard]] std::optional<FeatureVector> on_window_finalized(const WindowRecord& record, double emitted_at);

    uint64_t vectors_emitted() const { return vectors_emitted_; }
    uint64_t windows_rejected() const { return windows_rejected_; }

private:
    HistoryStore& history_;
    const StatsEngine& stats_;
    uint64_t vectors_emitted_ = 0;
    uint64_t windows_rejected_ = 0;
};

#endif // FEATURE_EMITTER_H
