#include "mitigation_report.hpp"
#include <sstream>
#include <iomanip>

namespace {
    std::string ratio_or_dash(const std::optional<double>& value) {
        if (!value) {
            return "-";
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4) << *value;
        return oss.str();
    }
}

MitigationReport MitigationReport::build(const std::vector<std::pair<std::string, SourceStats>>& rows,
                                         const std::unordered_set<std::string>& attackers) {
    MitigationReport r;

    for (const auto& [ip, s] : rows) {
        const bool is_attacker = attackers.count(ip) > 0;
        const bool classified = s.detections_pos > 0 || s.detections_neg > 0;
        r.classifications_total += s.detections_pos + s.detections_neg;

        if (s.detections_pos > 0 && s.detections_neg > 0) {
            r.hosts_mixed++;
        }

        if (is_attacker) {
            r.attackers_seen++;
            r.attacker_pkts += s.pkts_allowed + s.pkts_denied;
            r.attacker_pkts_denied += s.pkts_denied;
            if (classified) {
                r.attackers_classified++;
            }
            if (s.detections_pos > 0) {
                r.attackers_detected++;
                if (s.detections_neg == 0) {
                    r.attackers_only_positive++;
                    r.tp += s.detections_pos;
                }
            } else {
                r.fn += s.detections_neg;
            }
        } else {
            r.legitimate_seen++;
            r.legitimate_pkts += s.pkts_allowed + s.pkts_denied;
            r.legitimate_pkts_allowed += s.pkts_allowed;
            if (classified) {
                r.legitimate_classified++;
            }
            if (s.detections_pos > 0) {
                r.fp += s.detections_pos;
            } else if (s.detections_neg > 0) {
                r.legitimate_only_negative++;
                r.tn += s.detections_neg;
            }
        }
    }

    const double tp = static_cast<double>(r.tp);
    const double fp = static_cast<double>(r.fp);
    const double fn = static_cast<double>(r.fn);
    const double tn = static_cast<double>(r.tn);

    if (r.classifications_total > 0) {
        r.accuracy = (tp + tn) / static_cast<double>(r.classifications_total);
    }
    if (r.tp + r.fp > 0) {
        r.precision = tp / (tp + fp);
    }
    if (r.tp + r.fn > 0) {
        r.recall = tp / (tp + fn);
    }
    if (2 * r.tp + r.fp + r.fn > 0) {
        r.fscore = (2.0 * tp) / (2.0 * tp + fp + fn);
    }

    if (r.attackers_seen > 0) {
        r.attackers_detected_ratio = static_cast<double>(r.attackers_detected) / static_cast<double>(r.attackers_seen);
    }
    if (r.attacker_pkts > 0) {
        r.attacker_denied_ratio = static_cast<double>(r.attacker_pkts_denied) / static_cast<double>(r.attacker_pkts);
    }
    if (r.legitimate_pkts > 0) {
        r.legitimate_allowed_ratio = static_cast<double>(r.legitimate_pkts_allowed) / static_cast<double>(r.legitimate_pkts);
    }

    return r;
}

std::string MitigationReport::format() const {
    std::ostringstream oss;
    oss << "------   Classification statistics   -----\n";
    oss << "Total number of classifications: " << classifications_total << "\n";
    oss << "Attackers detection  : " << attackers_only_positive << " / " << attackers_classified << "\n";
    oss << "Legitimate detection : " << legitimate_only_negative << " / " << legitimate_classified << "\n";
    oss << "Attackers all        : " << attackers_only_positive << " / " << attackers_seen << "\n";
    oss << "Legitimate all       : " << legitimate_only_negative << " / " << legitimate_seen << "\n";
    oss << "Hosts with mixed results: " << hosts_mixed << "\n\n";

    oss << "Confusion matrix: [[TP " << tp << ", FP " << fp << "], [FN " << fn << ", TN " << tn << "]]\n";
    oss << "Accuracy  : " << ratio_or_dash(accuracy) << "\n";
    oss << "Precision : " << ratio_or_dash(precision) << "\n";
    oss << "Recall    : " << ratio_or_dash(recall) << "\n";
    oss << "F-Score   : " << ratio_or_dash(fscore) << "\n\n";

    oss << std::fixed << std::setprecision(3);
    oss << "-----   Per-packet mitigation statistics   -----\n";
    oss << "Attackers detected ratio              : " << attackers_detected_ratio << "\n";
    oss << "Real attackers packet denied ratio    : " << attacker_denied_ratio
        << " (" << attacker_pkts_denied << " / " << attacker_pkts << ")\n";
    oss << "Real legitimate packets allowed ratio : " << legitimate_allowed_ratio
        << " (" << legitimate_pkts_allowed << " / " << legitimate_pkts << ")\n";
    return oss.str();
}

std::unordered_set<std::string> read_attacker_list(std::istream& in) {
    std::unordered_set<std::string> attackers;
    std::string ip;
    while (in >> ip) {
        attackers.insert(ip);
    }
    return attackers;
}
