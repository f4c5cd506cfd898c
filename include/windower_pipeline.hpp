#ifndef WINDOWER_PIPELINE_H
#define WINDOWER_PIPELINE_H

#include <functional>
#include <memory>
#include <cstdint>
#include "anomaly_scorer.hpp"
#include "async_scorer.hpp"
#include "feature_emitter.hpp"
#include "history_store.hpp"
#include "mitigation_engine.hpp"
#include "packet_record.hpp"
#include "stats_engine.hpp"
#include "window_aggregator.hpp"
#include "windower_config.hpp"

struct PipelineCounters {
    uint64_t packets_processed = 0;
    uint64_t malformed_skipped = 0;
    uint64_t late_dropped = 0;
    uint64_t windows_finalized = 0;
    uint64_t windows_discarded = 0;
    uint64_t history_rejected = 0;
    uint64_t vectors_emitted = 0;
    uint64_t scorer_failures = 0;
    uint64_t scorer_dropped = 0;
    uint64_t shard_overflows = 0;
    uint64_t open_windows = 0;

    PipelineCounters& operator+=(const PipelineCounters& other);
};

// One shard of the engine: owns the aggregator and history of the sources
// routed to it and shares the mitigation engine with the other shards.
// Not thread-safe; a shard is driven by exactly one thread.
class WindowerPipeline {
public:
    using VectorObserver = std::function<void(const FeatureVector&)>;

    // With async_scorer set, vectors are queued to it and its completion
    // applies the results; otherwise the scorer runs inline. A null scorer
    // emits vectors without classifying them.
    WindowerPipeline(const WindowerConfig& config,
                     MitigationEngine& mitigation,
                     std::shared_ptr<const scoring::IAnomalyScorer> scorer,
                     AsyncScoringService* async_scorer = nullptr);

    // Allow/deny decision followed by the feature path
    Verdict process(const PacketRecord& pkt);

    // Feature path only, for callers that decide centrally
    void ingest(const PacketRecord& pkt);

    // End of stream: finalizes every open window and scores what it yields
    void flush();

    void set_vector_observer(VectorObserver observer) { observer_ = std::move(observer); }

    PipelineCounters counters() const;

    // Applies a score result to the mitigation engine; failed results are ignored
    static void apply_result(MitigationEngine& mitigation, const FeatureVector& fv,
                             const scoring::ScoreResult& result);

private:
    void handle_record(const WindowRecord& record, double now);
    void classify(const FeatureVector& fv);

    WindowerConfig config_;
    MitigationEngine& mitigation_;
    std::shared_ptr<const scoring::IAnomalyScorer> scorer_;
    AsyncScoringService* async_scorer_;

    StatsEngine stats_;
    WindowAggregator aggregator_;
    HistoryStore history_;
    FeatureEmitter emitter_;
    VectorObserver observer_;

    int64_t current_window_;
    double last_timestamp_ = 0.0;
    uint64_t scorer_failures_ = 0;
    uint64_t scorer_dropped_ = 0;
};

#endif // WINDOWER_PIPELINE_H
