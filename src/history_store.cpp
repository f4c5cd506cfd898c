#include "history_store.hpp"
#include <cstddef>

HistoryStore::HistoryStore(uint32_t history_min, size_t history_size,
                           double history_timeout, uint32_t packets_min,
                           size_t max_sources)
    : history_min_(history_min), history_size_(history_size),
      history_timeout_(history_timeout), packets_min_(packets_min),
      entries_(max_sources) {}

bool HistoryStore::push(const std::string& src_ip, WindowRecord record) {
    if (const auto* existing = entries_.peek(src_ip)) {
        if (!existing->empty() && record.window_id <= existing->back().window_id) {
            rejected_pushes_++;
            return false;
        }
    }

    auto& entry = entries_.get_or_create(src_ip);
    entry.push_back(std::move(record));
    trim(entry);
    return true;
}

void HistoryStore::trim(std::deque<WindowRecord>& entry) {
    // Staleness cap first, then the hard length cap. A timeout of 0 disables
    // the staleness cap.
    if (history_timeout_ > 0.0) {
        const double horizon = entry.back().window_end - history_timeout_;
        while (!entry.empty() && entry.front().window_end < horizon) {
            entry.pop_front();
            records_trimmed_++;
        }
    }

    if (history_size_ > 0) {
        while (entry.size() > history_size_) {
            entry.pop_front();
            records_trimmed_++;
        }
    }
}

std::optional<HistoryTail> HistoryStore::eligible_tail(const std::string& src_ip) const {
    const auto* entry = entries_.peek(src_ip);
    if (entry == nullptr || entry->empty() || history_min_ == 0) {
        return std::nullopt;
    }
    if (entry->size() < history_min_ || entry->back().pkts_total < packets_min_) {
        return std::nullopt;
    }

    HistoryTail tail;
    tail.windows.assign(entry->end() - static_cast<std::ptrdiff_t>(history_min_), entry->end());
    tail.recorded_span = static_cast<uint64_t>(entry->back().window_id - entry->front().window_id + 1);
    return tail;
}

bool HistoryStore::erase(const std::string& src_ip) {
    return entries_.erase(src_ip);
}

size_t HistoryStore::entry_size(const std::string& src_ip) const {
    const auto* entry = entries_.peek(src_ip);
    return entry == nullptr ? 0 : entry->size();
}
