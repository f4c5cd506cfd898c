#ifndef ASYNC_SCORER_H
#define ASYNC_SCORER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <cstdint>
#include "anomaly_scorer.hpp"
#include "window_record.hpp"

// Runs the scorer off the packet path. Each job carries a deadline: a job
// still queued when its deadline passes is cancelled, and a result that
// arrives after it is discarded. Both are reported as failed results, which
// callers treat as "no classification".
class AsyncScoringService {
public:
    using Completion = std::function<void(const FeatureVector&, const scoring::ScoreResult&)>;

    AsyncScoringService(std::shared_ptr<const scoring::IAnomalyScorer> scorer,
                        Completion on_complete,
                        uint32_t threads = 1,
                        size_t queue_size = 4096,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(250));
    ~AsyncScoringService();

    AsyncScoringService(const AsyncScoringService&) = delete;
    AsyncScoringService& operator=(const AsyncScoringService&) = delete;

    void start();
    // Cancels whatever is still queued and joins the workers
    void stop();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Returns false when the job was dropped (queue full or service stopped)
    bool submit(FeatureVector fv);

    // Blocks until the queue is empty and no job is in flight
    void drain();

    struct Metrics {
        uint64_t submitted;
        uint64_t completed;
        uint64_t failed;
        uint64_t dropped;
        uint64_t timed_out;
        uint64_t cancelled;
        size_t queue_depth;
    };
    Metrics get_metrics() const;

private:
    struct ScoringJob {
        FeatureVector fv;
        std::chrono::steady_clock::time_point deadline;
    };

    void worker_loop();
    void process_job(const ScoringJob& job);

    std::shared_ptr<const scoring::IAnomalyScorer> scorer_;
    Completion on_complete_;
    uint32_t thread_count_;
    size_t max_queue_size_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::queue<ScoringJob> job_queue_;
    size_t in_flight_ = 0;
    std::vector<std::thread> workers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> cancelled_{0};
};

#endif // ASYNC_SCORER_H
