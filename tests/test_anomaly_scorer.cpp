#include "anomaly_scorer.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>

using namespace scoring;

namespace {
    class ThrowingScorer : public BaseScorer {
    public:
        ThrowingScorer() : BaseScorer("throwing", 1.0) {}
        double computeScore(const FeatureVector&) const override {
            throw ScorerError("model backend unavailable");
        }
    };

    class NanScorer : public BaseScorer {
    public:
        NanScorer() : BaseScorer("nan", 1.0) {}
        double computeScore(const FeatureVector&) const override {
            return std::numeric_limits<double>::quiet_NaN();
        }
    };

    FeatureVector createVector(double pkts_total, double pkt_rate)
    {
        FeatureVector fv;
        fv.src_ip = "203.0.113.7";
        fv.pkts_total = pkts_total;
        fv.pkt_rate = pkt_rate;
        return fv;
    }
}

TEST(LinearScorerTest, WeightedSumPlusBias)
{
    LinearScorer scorer({{"pkts_total", 0.5}}, 1.0, 6.0);
    auto result = scorer.score(createVector(10.0, 0.0));

    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.score, 6.0);
    // Threshold is inclusive
    EXPECT_TRUE(result.anomalous);

    LinearScorer stricter({{"pkts_total", 0.5}}, 1.0, 6.5);
    EXPECT_FALSE(stricter.score(createVector(10.0, 0.0)).anomalous);
}

TEST(LinearScorerTest, LogisticLink)
{
    LinearScorer scorer({{"pkt_rate", 0.0}}, 0.0, 0.9, true);
    auto result = scorer.score(createVector(10.0, 100.0));
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.score, 0.5);
    EXPECT_FALSE(result.anomalous);
}

TEST(LinearScorerTest, UnknownFeatureIsRejected)
{
    EXPECT_THROW(LinearScorer({{"payload_entropy", 1.0}}, 0.0, 1.0), ScorerError);
    EXPECT_THROW(LinearScorer({}, 0.0, 1.0), ScorerError);
}

TEST(ZScoreScorerTest, RootMeanSquareOfZScores)
{
    ZScoreScorer scorer({{"pkts_total", 10.0, 2.0}, {"pkt_rate", 0.0, 1.0}}, 10.0);
    auto result = scorer.score(createVector(14.0, 3.0));

    ASSERT_TRUE(result.ok);
    EXPECT_NEAR(result.score, std::sqrt(6.5), 1e-12);
    EXPECT_FALSE(result.anomalous);
    EXPECT_EQ(scorer.getName(), "zscore");
}

TEST(ZScoreScorerTest, BaselineDeviationMustBePositive)
{
    EXPECT_THROW(ZScoreScorer({{"pkts_total", 10.0, 0.0}}, 1.0), ScorerError);
}

TEST(AnomalyScorerTest, FailuresBecomeUnclassifiedResults)
{
    ThrowingScorer throwing;
    auto result = throwing.score(createVector(1.0, 1.0));
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.anomalous);
    EXPECT_NE(result.error.find("model backend unavailable"), std::string::npos);

    NanScorer nan;
    auto nan_result = nan.score(createVector(1.0, 1.0));
    EXPECT_FALSE(nan_result.ok);
    EXPECT_FALSE(nan_result.error.empty());
}

TEST(ScorerFactoryTest, LinearModelFromStream)
{
    std::istringstream model(
        "# packets per second dominate\n"
        "pkt_rate 0.1\n"
        "pkts_total 0.01   # per window\n"
        "bias -1\n"
        "link identity\n");

    auto scorer = ScorerFactory::createFromStream("linear", model, 10.0);
    ASSERT_NE(scorer, nullptr);
    EXPECT_EQ(scorer->getName(), "linear");
    EXPECT_DOUBLE_EQ(scorer->getThreshold(), 10.0);

    auto result = scorer->score(createVector(100.0, 50.0));
    ASSERT_TRUE(result.ok);
    EXPECT_NEAR(result.score, 5.0, 1e-12);
}

TEST(ScorerFactoryTest, ZScoreModelFromStream)
{
    std::istringstream model("pkts_total 10 2\n\npkt_rate 0 1\n");
    auto scorer = ScorerFactory::createFromStream("zscore", model, 2.0);

    auto result = scorer->score(createVector(14.0, 3.0));
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.anomalous);
}

TEST(ScorerFactoryTest, BrokenModelsAreRejected)
{
    std::istringstream bad_number("pkt_rate fast\n");
    EXPECT_THROW(ScorerFactory::createFromStream("linear", bad_number, 1.0), ScorerError);

    std::istringstream missing_std("pkt_rate 1\n");
    EXPECT_THROW(ScorerFactory::createFromStream("zscore", missing_std, 1.0), ScorerError);

    std::istringstream bad_link("pkt_rate 1\nlink probit\n");
    EXPECT_THROW(ScorerFactory::createFromStream("linear", bad_link, 1.0), ScorerError);

    std::istringstream any("pkt_rate 1\n");
    EXPECT_THROW(ScorerFactory::createFromStream("forest", any, 1.0), ScorerError);

    EXPECT_THROW(ScorerFactory::create("zscore", "/nonexistent/windower/model.txt", 1.0), ScorerError);
}
