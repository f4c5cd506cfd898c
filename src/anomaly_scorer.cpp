#include "anomaly_scorer.hpp"
#include <fstream>
#include <sstream>
#include <cmath>

namespace scoring {
    namespace {
        size_t resolve_feature(const std::string& name) {
            int index = FeatureVector::feature_index(name);
            if (index < 0) {
                throw ScorerError("unknown feature '" + name + "'");
            }
            return static_cast<size_t>(index);
        }

        struct ModelLine {
            size_t line_no;
            std::string key;
            std::vector<std::string> values;
        };

        std::vector<ModelLine> read_model(std::istream& in) {
            std::vector<ModelLine> lines;
            std::string raw;
            size_t line_no = 0;
            while (std::getline(in, raw)) {
                ++line_no;
                size_t hash = raw.find('#');
                if (hash != std::string::npos) {
                    raw.erase(hash);
                }

                std::istringstream iss(raw);
                ModelLine line{line_no, {}, {}};
                if (!(iss >> line.key)) {
                    continue;
                }
                std::string value;
                while (iss >> value) {
                    line.values.push_back(value);
                }
                lines.push_back(std::move(line));
            }
            return lines;
        }

        double parse_number(const ModelLine& line, size_t pos) {
            if (pos >= line.values.size()) {
                throw ScorerError("line " + std::to_string(line.line_no) + ": missing value for '" + line.key + "'");
            }
            try {
                size_t used = 0;
                double v = std::stod(line.values[pos], &used);
                if (used != line.values[pos].size() || !std::isfinite(v)) {
                    throw ScorerError("line " + std::to_string(line.line_no) + ": bad number '" + line.values[pos] + "'");
                }
                return v;
            } catch (const std::logic_error&) {
                throw ScorerError("line " + std::to_string(line.line_no) + ": bad number '" + line.values[pos] + "'");
            }
        }
    }

    ScoreResult IAnomalyScorer::score(const FeatureVector& fv) const {
        ScoreResult result;
        try {
            double value = computeScore(fv);
            if (!std::isfinite(value)) {
                result.error = getName() + ": non-finite score";
                return result;
            }
            result.ok = true;
            result.score = value;
            result.anomalous = value >= getThreshold();
        } catch (const std::exception& e) {
            result.error = getName() + ": " + e.what();
        }
        return result;
    }

    LinearScorer::LinearScorer(const std::vector<Weight>& weights, double bias, double threshold, bool logistic)
        : BaseScorer("linear", threshold), bias_(bias), logistic_(logistic) {
        if (weights.empty()) {
            throw ScorerError("linear model has no weights");
        }
        for (const auto& w : weights) {
            weights_.emplace_back(resolve_feature(w.feature), w.weight);
        }
    }

    double LinearScorer::computeScore(const FeatureVector& fv) const {
        const auto row = fv.to_row();
        double sum = bias_;
        for (const auto& [index, weight] : weights_) {
            sum += weight * row[index];
        }
        return logistic_ ? 1.0 / (1.0 + std::exp(-sum)) : sum;
    }

    ZScoreScorer::ZScoreScorer(const std::vector<Baseline>& baselines, double threshold)
        : BaseScorer("zscore", threshold) {
        if (baselines.empty()) {
            throw ScorerError("zscore model has no baselines");
        }
        for (const auto& b : baselines) {
            if (!(b.stddev > 0.0)) {
                throw ScorerError("baseline deviation of '" + b.feature + "' must be positive");
            }
            columns_.push_back({resolve_feature(b.feature), b.mean, b.stddev});
        }
    }

    double ZScoreScorer::computeScore(const FeatureVector& fv) const {
        const auto row = fv.to_row();
        double sq = 0.0;
        for (const auto& col : columns_) {
            double z = (row[col.index] - col.mean) / col.stddev;
            sq += z * z;
        }
        return std::sqrt(sq / static_cast<double>(columns_.size()));
    }

    std::unique_ptr<IAnomalyScorer> ScorerFactory::create(const std::string& type,
                                                          const std::string& model_file,
                                                          double threshold) {
        std::ifstream file(model_file);
        if (!file.is_open()) {
            throw ScorerError("cannot open model file '" + model_file + "'");
        }
        return createFromStream(type, file, threshold);
    }

    std::unique_ptr<IAnomalyScorer> ScorerFactory::createFromStream(const std::string& type,
                                                                    std::istream& model,
                                                                    double threshold) {
        const auto lines = read_model(model);

        if (type == "linear") {
            std::vector<LinearScorer::Weight> weights;
            double bias = 0.0;
            bool logistic = false;
            for (const auto& line : lines) {
                if (line.key == "bias") {
                    bias = parse_number(line, 0);
                } else if (line.key == "link") {
                    if (line.values.empty() || (line.values[0] != "logistic" && line.values[0] != "identity")) {
                        throw ScorerError("line " + std::to_string(line.line_no) + ": link must be logistic or identity");
                    }
                    logistic = line.values[0] == "logistic";
                } else {
                    weights.push_back({line.key, parse_number(line, 0)});
                }
            }
            return std::make_unique<LinearScorer>(weights, bias, threshold, logistic);
        }

        if (type == "zscore") {
            std::vector<ZScoreScorer::Baseline> baselines;
            for (const auto& line : lines) {
                baselines.push_back({line.key, parse_number(line, 0), parse_number(line, 1)});
            }
            return std::make_unique<ZScoreScorer>(baselines, threshold);
        }

        throw ScorerError("unknown scorer type '" + type + "'");
    }
}
