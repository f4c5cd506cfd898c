#include "sharded_pipeline.hpp"
#include "file_logger.hpp"
#include <functional>

ShardedPipeline::ShardedPipeline(const WindowerConfig& config,
                                 MitigationEngine& mitigation,
                                 std::shared_ptr<const scoring::IAnomalyScorer> scorer)
    : config_(config), mitigation_(mitigation) {
    config_.validate();
    if (scorer && config_.async_scoring) {
        async_scorer_ = std::make_unique<AsyncScoringService>(
            scorer,
            [&mitigation](const FeatureVector& fv, const scoring::ScoreResult& result) {
                WindowerPipeline::apply_result(mitigation, fv, result);
            },
            config_.scorer_threads, config_.scorer_queue_size,
            std::chrono::milliseconds(config_.scorer_timeout_ms));
    }

    const uint32_t count = config_.shards > 0 ? config_.shards : 1;
    shards_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        auto shard = std::make_unique<Shard>();
        shard->pipeline = std::make_unique<WindowerPipeline>(config_, mitigation_, scorer, async_scorer_.get());
        shards_.push_back(std::move(shard));
    }
}

ShardedPipeline::~ShardedPipeline() {
    shutdown();
}

void ShardedPipeline::set_vector_observer(WindowerPipeline::VectorObserver observer) {
    for (auto& shard : shards_) {
        shard->pipeline->set_vector_observer(observer);
    }
}

void ShardedPipeline::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (async_scorer_) {
        async_scorer_->start();
    }
    for (auto& shard : shards_) {
        {
            std::lock_guard<std::mutex> lock(shard->mutex);
            shard->stopping = false;
        }
        Shard& ref = *shard;
        shard->worker = std::thread([this, &ref]() { shard_loop(ref); });
    }
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::DEBUG_LOG,
                  "Windower pipeline started with " + std::to_string(shards_.size()) + " shard(s)");
}

size_t ShardedPipeline::shard_of(const std::string& src_ip) const {
    return std::hash<std::string>{}(src_ip) % shards_.size();
}

Verdict ShardedPipeline::process(const PacketRecord& pkt) {
    Verdict verdict = Verdict::ALLOW;
    if (!pkt.is_malformed() && WindowAggregator::timestamp_in_range(pkt.timestamp, config_.window_length)) {
        verdict = mitigation_.decide(pkt.src_ip, pkt.timestamp);
    }

    Shard& shard = *shards_[shard_of(pkt.src_ip)];
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (!shard.stopping && shard.queue.size() < config_.shard_queue_size) {
            shard.queue.push_back(pkt);
            queued = true;
        }
    }

    if (queued) {
        shard.cv.notify_one();
    } else {
        const uint64_t dropped = shard.overflows.fetch_add(1, std::memory_order_relaxed) + 1;
        if (dropped == 1 || dropped % 10000 == 0) {
            FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::DEBUG_LOG,
                             "Shard queue full, " + std::to_string(dropped) +
                             " packets skipped feature extraction");
        }
    }
    return verdict;
}

void ShardedPipeline::shard_loop(Shard& shard) {
    std::deque<PacketRecord> batch;
    for (;;) {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(shard.mutex);
            shard.cv.wait(lock, [&shard] { return !shard.queue.empty() || shard.stopping; });
            batch.swap(shard.queue);
            stopping = shard.stopping;
        }

        for (const auto& pkt : batch) {
            shard.pipeline->ingest(pkt);
        }
        batch.clear();

        if (stopping) {
            // Packets queued after the swap are still owed to this shard
            std::deque<PacketRecord> rest;
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                rest.swap(shard.queue);
            }
            for (const auto& pkt : rest) {
                shard.pipeline->ingest(pkt);
            }
            shard.pipeline->flush();
            publish(shard);
            return;
        }
        publish(shard);
    }
}

void ShardedPipeline::publish(Shard& shard) {
    const auto snapshot = shard.pipeline->counters();
    std::lock_guard<std::mutex> lock(shard.counters_mutex);
    shard.published = snapshot;
}

void ShardedPipeline::shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    for (auto& shard : shards_) {
        {
            std::lock_guard<std::mutex> lock(shard->mutex);
            shard->stopping = true;
        }
        shard->cv.notify_all();
    }
    for (auto& shard : shards_) {
        if (shard->worker.joinable()) {
            shard->worker.join();
        }
    }

    if (async_scorer_) {
        async_scorer_->drain();
        async_scorer_->stop();
    }

    const auto c = counters();
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::DEBUG_LOG,
                  "Windower pipeline stopped: " + std::to_string(c.packets_processed) + " packets, " +
                  std::to_string(c.vectors_emitted) + " feature vectors, " +
                  std::to_string(c.shard_overflows) + " shard overflows");
}

PipelineCounters ShardedPipeline::counters() const {
    PipelineCounters total;
    for (const auto& shard : shards_) {
        {
            std::lock_guard<std::mutex> lock(shard->counters_mutex);
            total += shard->published;
        }
        total.shard_overflows += shard->overflows.load(std::memory_order_relaxed);
    }
    if (async_scorer_) {
        const auto m = async_scorer_->get_metrics();
        total.scorer_failures += m.failed;
    }
    return total;
}

std::optional<AsyncScoringService::Metrics> ShardedPipeline::scorer_metrics() const {
    if (!async_scorer_) {
        return std::nullopt;
    }
    return async_scorer_->get_metrics();
}
