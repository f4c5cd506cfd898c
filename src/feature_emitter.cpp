#include "feature_emitter.hpp"

std::optional<FeatureVector> FeatureEmitter::on_window_finalized(const WindowRecord& record, double emitted_at) {
    const std::string src_ip = record.src_ip;
    const int64_t window_id = record.window_id;

    if (!history_.push(src_ip, record)) {
        windows_rejected_++;
        return std::nullopt;
    }

    auto tail = history_.eligible_tail(src_ip);
    if (!tail) {
        return std::nullopt;
    }

    FeatureVector fv = stats_.summarize(tail->windows, tail->recorded_span);
    fv.src_ip = src_ip;
    fv.window_id = window_id;
    fv.emitted_at = emitted_at;
    vectors_emitted_++;
    return fv;
}
