#ifndef ANOMALY_SCORER_H
#define ANOMALY_SCORER_H

#include <string>
#include <vector>
#include <memory>
#include <istream>
#include <stdexcept>
#include "window_record.hpp"

namespace scoring {
    struct ScoreResult {
        bool ok = false;          // false: no classification, caller fails open
        bool anomalous = false;
        double score = 0.0;
        std::string error;
    };

    class ScorerError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Model invoked on every emitted feature vector. Implementations report
    // failures by throwing; score() turns any failure into a failed result.
    class IAnomalyScorer {
    public:
        virtual ~IAnomalyScorer() = default;
        virtual double computeScore(const FeatureVector& fv) const = 0;
        virtual std::string getName() const = 0;
        virtual double getThreshold() const = 0;

        // Never throws. Anomalous when the score reaches the threshold.
        ScoreResult score(const FeatureVector& fv) const;
    };

    class BaseScorer : public IAnomalyScorer {
    private:
        std::string name_;
        double threshold_;

    public:
        BaseScorer(std::string name, double threshold)
            : name_(std::move(name)), threshold_(threshold) {}

        std::string getName() const override { return name_; }
        double getThreshold() const override { return threshold_; }
    };

    // Weighted sum of named features plus bias, optionally through a logistic link
    class LinearScorer : public BaseScorer {
    public:
        struct Weight {
            std::string feature;
            double weight;
        };

        LinearScorer(const std::vector<Weight>& weights, double bias, double threshold, bool logistic = false);
        double computeScore(const FeatureVector& fv) const override;

    private:
        std::vector<std::pair<size_t, double>> weights_;
        double bias_;
        bool logistic_;
    };

    // Deviation from a learned baseline: root mean square of per-feature
    // z-scores. Behaves like a reconstruction error, large for traffic far
    // from what the baseline was fitted on.
    class ZScoreScorer : public BaseScorer {
    public:
        struct Baseline {
            std::string feature;
            double mean;
            double stddev;
        };

        ZScoreScorer(const std::vector<Baseline>& baselines, double threshold);
        double computeScore(const FeatureVector& fv) const override;

    private:
        struct Column {
            size_t index;
            double mean;
            double stddev;
        };
        std::vector<Column> columns_;
    };

    class ScorerFactory {
    public:
        // type is "linear" or "zscore". Model files hold one `feature value
        // [value]` entry per line plus optional `bias` and `link` keys;
        // `#` starts a comment. Throws ScorerError on any problem.
        static std::unique_ptr<IAnomalyScorer> create(const std::string& type,
                                                      const std::string& model_file,
                                                      double threshold);
        static std::unique_ptr<IAnomalyScorer> createFromStream(const std::string& type,
                                                                std::istream& model,
                                                                double threshold);
    };
}

#endif // ANOMALY_SCORER_H
