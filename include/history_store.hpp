#ifndef HISTORY_STORE_H
#define HISTORY_STORE_H

#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <cstdint>
#include "lru_map.hpp"
#include "window_record.hpp"

// Slice of a source's history that is ready to be summarized
struct HistoryTail {
    std::vector<WindowRecord> windows;   // oldest first
    uint64_t recorded_span = 0;          // newest id - oldest retained id + 1
};

// Per-source ordered history of finalized windows, bounded in length
// (history_size), in age (history_timeout) and in number of tracked sources.
class HistoryStore {
public:
    HistoryStore(uint32_t history_min = 6, size_t history_size = 0,
                 double history_timeout = 120.0, uint32_t packets_min = 20,
                 size_t max_sources = 0);

    // Appends a record and trims the entry. Returns false, leaving the entry
    // untouched, when the record does not advance the source's window id.
    bool push(const std::string& src_ip, WindowRecord record);

    // The history_min most recent records once the entry holds enough of them
    // and its newest record has at least packets_min packets
    std::optional<HistoryTail> eligible_tail(const std::string& src_ip) const;

    bool erase(const std::string& src_ip);
    size_t entry_size(const std::string& src_ip) const;
    size_t size() const { return entries_.size(); }

    uint64_t rejected_pushes() const { return rejected_pushes_; }
    uint64_t records_trimmed() const { return records_trimmed_; }
    uint64_t sources_evicted() const { return entries_.evictions(); }

private:
    void trim(std::deque<WindowRecord>& entry);

    uint32_t history_min_;
    size_t history_size_;
    double history_timeout_;
    uint32_t packets_min_;

    LruMap<std::string, std::deque<WindowRecord>> entries_;
    uint64_t rejected_pushes_ = 0;
    uint64_t records_trimmed_ = 0;
};

#endif // HISTORY_STORE_H
