#ifndef MITIGATION_REPORT_H
#define MITIGATION_REPORT_H

#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <unordered_set>
#include <cstdint>
#include "mitigation_engine.hpp"

// End-of-run evaluation of the mitigation counters against a ground-truth
// list of attacking sources.
struct MitigationReport {
    uint64_t classifications_total = 0;

    // Confusion matrix over classifications
    uint64_t tp = 0;
    uint64_t fp = 0;
    uint64_t fn = 0;
    uint64_t tn = 0;
    std::optional<double> accuracy;
    std::optional<double> precision;
    std::optional<double> recall;
    std::optional<double> fscore;

    // Host level
    size_t attackers_seen = 0;
    size_t attackers_classified = 0;      // at least one classification
    size_t attackers_only_positive = 0;   // classified, never negative
    size_t attackers_detected = 0;        // at least one positive
    size_t legitimate_seen = 0;
    size_t legitimate_classified = 0;
    size_t legitimate_only_negative = 0;  // classified, never positive
    size_t hosts_mixed = 0;               // both positive and negative results
    double attackers_detected_ratio = 1.0;

    // Packet level
    uint64_t attacker_pkts = 0;
    uint64_t attacker_pkts_denied = 0;
    uint64_t legitimate_pkts = 0;
    uint64_t legitimate_pkts_allowed = 0;
    double attacker_denied_ratio = 1.0;
    double legitimate_allowed_ratio = 1.0;

    static MitigationReport build(const std::vector<std::pair<std::string, SourceStats>>& rows,
                                  const std::unordered_set<std::string>& attackers);

    std::string format() const;
};

// Whitespace separated addresses
std::unordered_set<std::string> read_attacker_list(std::istream& in);

#endif // MITIGATION_REPORT_H
