#include "async_scorer.hpp"
#include "file_logger.hpp"

AsyncScoringService::AsyncScoringService(std::shared_ptr<const scoring::IAnomalyScorer> scorer,
                                         Completion on_complete,
                                         uint32_t threads,
                                         size_t queue_size,
                                         std::chrono::milliseconds timeout)
    : scorer_(std::move(scorer)), on_complete_(std::move(on_complete)),
      thread_count_(threads > 0 ? threads : 1), max_queue_size_(queue_size > 0 ? queue_size : 1),
      timeout_(timeout) {}

AsyncScoringService::~AsyncScoringService() {
    stop();
}

void AsyncScoringService::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    shutdown_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    for (uint32_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&AsyncScoringService::worker_loop, this);
    }
}

void AsyncScoringService::stop() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
        pending = job_queue_.size();
        std::queue<ScoringJob>().swap(job_queue_);
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    {
        // Under the queue lock so a drain() between its predicate check and
        // its wait cannot miss the wakeup
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false, std::memory_order_release);
    }
    idle_cv_.notify_all();

    if (pending > 0) {
        cancelled_.fetch_add(pending, std::memory_order_relaxed);
        FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::SCORER_LOG,
                         "Scoring stopped with " + std::to_string(pending) + " queued jobs cancelled");
    }
}

bool AsyncScoringService::submit(FeatureVector fv) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load(std::memory_order_acquire) || shutdown_requested_.load(std::memory_order_acquire) ||
            job_queue_.size() >= max_queue_size_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        job_queue_.push({std::move(fv), std::chrono::steady_clock::now() + timeout_});
        submitted_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_cv_.notify_one();
    return true;
}

void AsyncScoringService::drain() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return (job_queue_.empty() && in_flight_ == 0) || !running_.load(std::memory_order_acquire);
    });
}

void AsyncScoringService::worker_loop() {
    for (;;) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this] {
            return !job_queue_.empty() || shutdown_requested_.load(std::memory_order_acquire);
        });

        if (shutdown_requested_.load(std::memory_order_acquire)) {
            break;
        }

        ScoringJob job = std::move(job_queue_.front());
        job_queue_.pop();
        ++in_flight_;
        lock.unlock();

        process_job(job);

        lock.lock();
        --in_flight_;
        if (job_queue_.empty() && in_flight_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

void AsyncScoringService::process_job(const ScoringJob& job) {
    scoring::ScoreResult result;

    if (std::chrono::steady_clock::now() > job.deadline) {
        timed_out_.fetch_add(1, std::memory_order_relaxed);
        result.error = "deadline expired before scoring";
    } else {
        result = scorer_->score(job.fv);
        if (result.ok && std::chrono::steady_clock::now() > job.deadline) {
            timed_out_.fetch_add(1, std::memory_order_relaxed);
            result = scoring::ScoreResult{};
            result.error = "scorer exceeded its deadline";
        }
    }

    if (result.ok) {
        completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
        FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::SCORER_LOG,
                         "No classification for " + job.fv.src_ip + " window " +
                         std::to_string(job.fv.window_id) + ": " + result.error);
    }

    try {
        on_complete_(job.fv, result);
    } catch (const std::exception& e) {
        FILE_LOG_ERROR(g_file_logger, FileLogger::FileType::SCORER_LOG,
                       std::string("Scoring completion failed: ") + e.what());
    }
}

AsyncScoringService::Metrics AsyncScoringService::get_metrics() const {
    Metrics m{};
    m.submitted = submitted_.load(std::memory_order_relaxed);
    m.completed = completed_.load(std::memory_order_relaxed);
    m.failed = failed_.load(std::memory_order_relaxed);
    m.dropped = dropped_.load(std::memory_order_relaxed);
    m.timed_out = timed_out_.load(std::memory_order_relaxed);
    m.cancelled = cancelled_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(queue_mutex_);
    m.queue_depth = job_queue_.size();
    return m;
}
