#include "mitigation_engine.hpp"
#include "file_logger.hpp"
#include <algorithm>
#include <functional>
#include <sstream>
#include <iomanip>

const char* verdict_name(Verdict verdict) {
    return verdict == Verdict::DENY ? "deny" : "allow";
}

MitigationEngine::MitigationEngine(size_t denylist_size, size_t max_tracked_sources)
    : denylist_size(denylist_size > 0 ? denylist_size : 1) {
    const size_t per_stripe =
        max_tracked_sources == 0 ? 0 : (max_tracked_sources + STATS_STRIPES - 1) / STATS_STRIPES;
    stripes_.reserve(STATS_STRIPES);
    for (size_t i = 0; i < STATS_STRIPES; ++i) {
        stripes_.push_back(std::make_unique<StatsStripe>(per_stripe));
    }
}

MitigationEngine::StatsStripe& MitigationEngine::stripe_for(const std::string& src_ip) const {
    return *stripes_[std::hash<std::string>{}(src_ip) % stripes_.size()];
}

Verdict MitigationEngine::decide(const std::string& src_ip, double timestamp) {
    std::shared_lock<std::shared_mutex> lock(denylist_mutex_);

    auto it = denylist_.find(src_ip);
    if (it != denylist_.end()) {
        it->second.pkts_denied.fetch_add(1, std::memory_order_relaxed);
        pkts_denied_total.fetch_add(1, std::memory_order_relaxed);
        return Verdict::DENY;
    }

    {
        StatsStripe& stripe = stripe_for(src_ip);
        std::lock_guard<std::mutex> stats_lock(stripe.mutex);
        SourceStats& stats = stripe.sources.get_or_create(src_ip);
        if (stats.first_seen < 0.0) {
            stats.first_seen = timestamp;
        }
        stats.pkts_allowed++;
    }
    pkts_allowed_total.fetch_add(1, std::memory_order_relaxed);
    return Verdict::ALLOW;
}

void MitigationEngine::apply_classification(const std::string& src_ip, bool anomalous,
                                            double detection_time, double score) {
    std::unique_lock<std::shared_mutex> lock(denylist_mutex_);
    (anomalous ? detections_pos_total : detections_neg_total).fetch_add(1, std::memory_order_relaxed);

    // Already denylisted: keep counting, enforcement stays frozen
    auto it = denylist_.find(src_ip);
    if (it != denylist_.end()) {
        SourceStats& stats = it->second.stats;
        if (anomalous) {
            stats.detections_pos++;
        } else {
            stats.detections_neg++;
        }
        stats.last_score = score;
        return;
    }

    SourceStats promoted;
    {
        StatsStripe& stripe = stripe_for(src_ip);
        std::lock_guard<std::mutex> stats_lock(stripe.mutex);
        SourceStats& current = stripe.sources.get_or_create(src_ip);
        current.last_score = score;
        if (!anomalous) {
            current.detections_neg++;
            return;
        }

        promoted = current;
        stripe.sources.erase(src_ip);
    }
    promoted.detections_pos++;
    promoted.denylisted = true;
    if (promoted.detected_after < 0.0) {
        const double base = promoted.first_seen >= 0.0 ? promoted.first_seen : detection_time;
        promoted.detected_after = std::max(0.0, detection_time - base);
    }

    if (denylist_.size() >= denylist_size) {
        evict_oldest_locked();
    }

    detection_order_.push_back(src_ip);
    DenyEntry& entry = denylist_[src_ip];
    entry.stats = promoted;
    entry.pkts_denied.store(promoted.pkts_denied, std::memory_order_relaxed);
    entry.order_it = std::prev(detection_order_.end());

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "DENYLISTED " << src_ip << " score=" << score
        << " detected_after=" << promoted.detected_after << "s"
        << " pkts_allowed=" << promoted.pkts_allowed;
    g_file_logger.write_detection(oss.str());
}

void MitigationEngine::evict_oldest_locked() {
    if (detection_order_.empty()) {
        return;
    }
    const std::string victim = detection_order_.front();
    auto it = denylist_.find(victim);

    // Counters survive eviction; only enforcement reverts to allow
    SourceStats kept = export_entry(it->second);
    kept.denylisted = false;
    {
        StatsStripe& stripe = stripe_for(victim);
        std::lock_guard<std::mutex> stats_lock(stripe.mutex);
        stripe.sources.put(victim, kept);
    }

    denylist_.erase(it);
    detection_order_.pop_front();
    denylist_evictions.fetch_add(1, std::memory_order_relaxed);

    FILE_LOG_WARNING(g_file_logger, FileLogger::FileType::DETECTION_LOG,
                     "Denylist full (" + std::to_string(denylist_size) + "), evicted oldest detection " + victim);
}

SourceStats MitigationEngine::export_entry(const DenyEntry& entry) const {
    SourceStats stats = entry.stats;
    stats.pkts_denied = entry.pkts_denied.load(std::memory_order_relaxed);
    return stats;
}

bool MitigationEngine::is_denylisted(const std::string& src_ip) const {
    std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
    return denylist_.count(src_ip) > 0;
}

std::optional<SourceStats> MitigationEngine::get_stats(const std::string& src_ip) const {
    std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
    auto it = denylist_.find(src_ip);
    if (it != denylist_.end()) {
        return export_entry(it->second);
    }

    StatsStripe& stripe = stripe_for(src_ip);
    std::lock_guard<std::mutex> stats_lock(stripe.mutex);
    if (const SourceStats* stats = stripe.sources.peek(src_ip)) {
        return *stats;
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, SourceStats>> MitigationEngine::snapshot() const {
    std::vector<std::pair<std::string, SourceStats>> rows;
    {
        std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
        rows.reserve(denylist_.size());
        for (const auto& [ip, entry] : denylist_) {
            rows.emplace_back(ip, export_entry(entry));
        }

        for (const auto& stripe : stripes_) {
            std::lock_guard<std::mutex> stats_lock(stripe->mutex);
            stripe->sources.for_each([&rows](const std::string& ip, const SourceStats& stats) {
                rows.emplace_back(ip, stats);
            });
        }
    }

    std::sort(rows.begin(), rows.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return rows;
}

std::vector<std::string> MitigationEngine::get_denylisted_sources() const {
    std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
    return std::vector<std::string>(detection_order_.begin(), detection_order_.end());
}

size_t MitigationEngine::get_denylist_count() const {
    std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
    return denylist_.size();
}

MitigationEngine::Metrics MitigationEngine::get_metrics() const {
    Metrics m{};
    {
        std::shared_lock<std::shared_mutex> lock(denylist_mutex_);
        m.denylisted_sources = denylist_.size();
        for (const auto& stripe : stripes_) {
            std::lock_guard<std::mutex> stats_lock(stripe->mutex);
            m.monitored_sources += stripe->sources.size();
        }
    }
    m.pkts_allowed = pkts_allowed_total.load(std::memory_order_relaxed);
    m.pkts_denied = pkts_denied_total.load(std::memory_order_relaxed);
    m.detections_pos = detections_pos_total.load(std::memory_order_relaxed);
    m.detections_neg = detections_neg_total.load(std::memory_order_relaxed);
    m.denylist_evictions = denylist_evictions.load(std::memory_order_relaxed);
    return m;
}
