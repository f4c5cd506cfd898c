#ifndef SHARDED_PIPELINE_H
#define SHARDED_PIPELINE_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "async_scorer.hpp"
#include "mitigation_engine.hpp"
#include "windower_pipeline.hpp"

// Partitions sources across worker threads. The allow/deny decision is made
// on the caller thread; the feature path runs on the shard owning the source,
// so every source is aggregated by exactly one thread in arrival order.
class ShardedPipeline {
public:
    ShardedPipeline(const WindowerConfig& config,
                    MitigationEngine& mitigation,
                    std::shared_ptr<const scoring::IAnomalyScorer> scorer);
    ~ShardedPipeline();

    ShardedPipeline(const ShardedPipeline&) = delete;
    ShardedPipeline& operator=(const ShardedPipeline&) = delete;

    // Observer runs on the shard threads; set it before start()
    void set_vector_observer(WindowerPipeline::VectorObserver observer);

    void start();

    // A full shard queue drops the packet from the feature path only
    Verdict process(const PacketRecord& pkt);

    // Drains every queue, flushes open windows and waits for pending scores
    void shutdown();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    size_t shard_count() const { return shards_.size(); }
    size_t shard_of(const std::string& src_ip) const;

    PipelineCounters counters() const;
    std::optional<AsyncScoringService::Metrics> scorer_metrics() const;

private:
    struct Shard {
        std::unique_ptr<WindowerPipeline> pipeline;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<PacketRecord> queue;
        bool stopping = false;
        std::thread worker;
        std::atomic<uint64_t> overflows{0};

        mutable std::mutex counters_mutex;
        PipelineCounters published;
    };

    void shard_loop(Shard& shard);
    static void publish(Shard& shard);

    WindowerConfig config_;
    MitigationEngine& mitigation_;
    std::unique_ptr<AsyncScoringService> async_scorer_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<bool> running_{false};
};

#endif // SHARDED_PIPELINE_H
