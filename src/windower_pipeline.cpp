#include "windower_pipeline.hpp"
#include "file_logger.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

PipelineCounters& PipelineCounters::operator+=(const PipelineCounters& other) {
    packets_processed += other.packets_processed;
    malformed_skipped += other.malformed_skipped;
    late_dropped += other.late_dropped;
    windows_finalized += other.windows_finalized;
    windows_discarded += other.windows_discarded;
    history_rejected += other.history_rejected;
    vectors_emitted += other.vectors_emitted;
    scorer_failures += other.scorer_failures;
    scorer_dropped += other.scorer_dropped;
    shard_overflows += other.shard_overflows;
    open_windows += other.open_windows;
    return *this;
}

namespace {
    const WindowerConfig& validated(const WindowerConfig& config) {
        config.validate();
        return config;
    }
}

WindowerPipeline::WindowerPipeline(const WindowerConfig& config,
                                   MitigationEngine& mitigation,
                                   std::shared_ptr<const scoring::IAnomalyScorer> scorer,
                                   AsyncScoringService* async_scorer)
    : config_(validated(config)),
      mitigation_(mitigation),
      scorer_(std::move(scorer)),
      async_scorer_(async_scorer),
      stats_(config.window_length),
      aggregator_(config.window_length, config.packets_min, config.samples_size, config.random_seed),
      history_(config.history_min, config.history_size, config.history_timeout,
               config.packets_min, config.max_tracked_sources),
      emitter_(history_, stats_),
      current_window_(std::numeric_limits<int64_t>::min()) {}

Verdict WindowerPipeline::process(const PacketRecord& pkt) {
    Verdict verdict = Verdict::ALLOW;
    if (!pkt.is_malformed() && aggregator_.timestamp_in_range(pkt.timestamp)) {
        verdict = mitigation_.decide(pkt.src_ip, pkt.timestamp);
    }
    ingest(pkt);
    return verdict;
}

void WindowerPipeline::ingest(const PacketRecord& pkt) {
    if (!pkt.is_malformed() && aggregator_.timestamp_in_range(pkt.timestamp)) {
        last_timestamp_ = std::max(last_timestamp_, pkt.timestamp);

        // When the stream enters a new window, close windows of sources that
        // went quiet. One window of slack absorbs reordering across sources.
        const int64_t wid = aggregator_.window_id_of(pkt.timestamp);
        if (wid > current_window_) {
            if (current_window_ != std::numeric_limits<int64_t>::min()) {
                for (const auto& record : aggregator_.expire(pkt.timestamp - config_.window_length)) {
                    handle_record(record, pkt.timestamp);
                }
            }
            current_window_ = wid;
        }
    }

    if (auto record = aggregator_.observe(pkt)) {
        handle_record(*record, pkt.timestamp);
    }
}

void WindowerPipeline::flush() {
    const auto records = aggregator_.flush();
    for (const auto& record : records) {
        handle_record(record, std::max(last_timestamp_, record.last_packet_ts));
    }

    const auto c = counters();
    if (c.late_dropped > 0 || c.malformed_skipped > 0) {
        FILE_LOG_INFO(g_file_logger, FileLogger::FileType::DEBUG_LOG,
                      "Shard flushed: " + std::to_string(c.late_dropped) + " late packets dropped, " +
                      std::to_string(c.malformed_skipped) + " malformed packets skipped");
    }
}

void WindowerPipeline::handle_record(const WindowRecord& record, double now) {
    if (auto fv = emitter_.on_window_finalized(record, now)) {
        classify(*fv);
    }
}

void WindowerPipeline::classify(const FeatureVector& fv) {
    if (observer_) {
        observer_(fv);
    }
    if (!scorer_) {
        return;
    }

    if (async_scorer_ != nullptr) {
        if (!async_scorer_->submit(fv)) {
            scorer_dropped_++;
            FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::SCORER_LOG,
                             "Scoring queue full, no classification for " + fv.src_ip +
                             " window " + std::to_string(fv.window_id));
        }
        return;
    }

    const auto result = scorer_->score(fv);
    if (!result.ok) {
        scorer_failures_++;
        FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::SCORER_LOG,
                         "No classification for " + fv.src_ip + " window " +
                         std::to_string(fv.window_id) + ": " + result.error);
        return;
    }
    apply_result(mitigation_, fv, result);
}

void WindowerPipeline::apply_result(MitigationEngine& mitigation, const FeatureVector& fv,
                                    const scoring::ScoreResult& result) {
    if (!result.ok) {
        return;
    }
    mitigation.apply_classification(fv.src_ip, result.anomalous, fv.emitted_at, result.score);

    std::ostringstream oss;
    oss << fv.src_ip << " window " << fv.window_id << " score " << result.score
        << (result.anomalous ? " anomalous" : " normal");
    FILE_LOG_DEBUG(g_file_logger, FileLogger::FileType::DETECTION_LOG, oss.str());
}

PipelineCounters WindowerPipeline::counters() const {
    const auto agg = aggregator_.counters();
    PipelineCounters c;
    c.packets_processed = agg.packets_observed + agg.malformed_skipped + agg.late_dropped;
    c.malformed_skipped = agg.malformed_skipped;
    c.late_dropped = agg.late_dropped;
    c.windows_finalized = agg.windows_finalized;
    c.windows_discarded = agg.windows_discarded;
    c.history_rejected = emitter_.windows_rejected();
    c.vectors_emitted = emitter_.vectors_emitted();
    c.scorer_failures = scorer_failures_;
    c.scorer_dropped = scorer_dropped_;
    c.open_windows = agg.open_buckets;
    return c;
}
