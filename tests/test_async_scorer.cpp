#include "async_scorer.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {
    class SlowScorer : public scoring::BaseScorer {
    public:
        SlowScorer(std::chrono::milliseconds delay, double threshold)
            : BaseScorer("slow", threshold), delay_(delay) {}
        double computeScore(const FeatureVector& fv) const override {
            std::this_thread::sleep_for(delay_);
            return fv.pkt_rate;
        }
    private:
        std::chrono::milliseconds delay_;
    };

    class FailingScorer : public scoring::BaseScorer {
    public:
        FailingScorer() : BaseScorer("failing", 1.0) {}
        double computeScore(const FeatureVector&) const override {
            throw scoring::ScorerError("inference failed");
        }
    };
}

class AsyncScorerTest : public ::testing::Test
{
  protected:
    std::mutex results_mutex;
    std::vector<std::pair<std::string, scoring::ScoreResult>> results;

    AsyncScoringService::Completion collector()
    {
        return [this](const FeatureVector &fv, const scoring::ScoreResult &result)
        {
            std::lock_guard<std::mutex> lock(results_mutex);
            results.emplace_back(fv.src_ip, result);
        };
    }

    static FeatureVector createVector(const std::string &src, double pkt_rate)
    {
        FeatureVector fv;
        fv.src_ip = src;
        fv.pkt_rate = pkt_rate;
        return fv;
    }
};

TEST_F(AsyncScorerTest, ScoresEverySubmittedVector)
{
    auto scorer = std::make_shared<SlowScorer>(0ms, 50.0);
    AsyncScoringService service(scorer, collector(), 2, 64, 1000ms);
    service.start();

    for (int i = 0; i < 10; ++i)
    {
        ASSERT_TRUE(service.submit(createVector("10.0.0." + std::to_string(i), i * 10.0)));
    }
    service.drain();

    auto metrics = service.get_metrics();
    EXPECT_EQ(metrics.submitted, 10u);
    EXPECT_EQ(metrics.completed, 10u);
    EXPECT_EQ(metrics.failed, 0u);
    EXPECT_EQ(metrics.queue_depth, 0u);

    std::lock_guard<std::mutex> lock(results_mutex);
    ASSERT_EQ(results.size(), 10u);
    size_t anomalous = 0;
    for (const auto &[src, result] : results)
    {
        EXPECT_TRUE(result.ok);
        if (result.anomalous)
            anomalous++;
    }
    // pkt_rate 50..90
    EXPECT_EQ(anomalous, 5u);
}

TEST_F(AsyncScorerTest, FailuresAreReportedAsUnclassified)
{
    AsyncScoringService service(std::make_shared<FailingScorer>(), collector());
    service.start();
    ASSERT_TRUE(service.submit(createVector("10.0.1.1", 1.0)));
    service.drain();

    EXPECT_EQ(service.get_metrics().failed, 1u);
    std::lock_guard<std::mutex> lock(results_mutex);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].second.ok);
    EXPECT_FALSE(results[0].second.anomalous);
}

TEST_F(AsyncScorerTest, SlowScorerMissesItsDeadline)
{
    auto scorer = std::make_shared<SlowScorer>(50ms, 0.0);
    AsyncScoringService service(scorer, collector(), 1, 16, 5ms);
    service.start();
    ASSERT_TRUE(service.submit(createVector("10.0.2.1", 1.0)));
    service.drain();

    auto metrics = service.get_metrics();
    EXPECT_EQ(metrics.timed_out, 1u);
    EXPECT_EQ(metrics.completed, 0u);

    std::lock_guard<std::mutex> lock(results_mutex);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].second.ok);
}

TEST_F(AsyncScorerTest, SubmitWithoutWorkersIsDropped)
{
    AsyncScoringService service(std::make_shared<SlowScorer>(0ms, 1.0), collector());
    EXPECT_FALSE(service.submit(createVector("10.0.3.1", 1.0)));
    EXPECT_EQ(service.get_metrics().dropped, 1u);

    std::lock_guard<std::mutex> lock(results_mutex);
    EXPECT_TRUE(results.empty());
}

TEST_F(AsyncScorerTest, FullQueueDropsNewJobs)
{
    auto scorer = std::make_shared<SlowScorer>(100ms, 1.0);
    AsyncScoringService service(scorer, collector(), 1, 2, 5000ms);
    service.start();

    size_t accepted = 0;
    for (int i = 0; i < 10; ++i)
    {
        if (service.submit(createVector("10.0.4.1", 1.0)))
            accepted++;
    }
    // At most one in flight plus two queued
    EXPECT_LE(accepted, 3u);
    EXPECT_EQ(service.get_metrics().dropped, 10u - accepted);
    service.drain();
}

TEST_F(AsyncScorerTest, StopCancelsQueuedJobs)
{
    auto scorer = std::make_shared<SlowScorer>(30ms, 1.0);
    AsyncScoringService service(scorer, collector(), 1, 16, 5000ms);
    service.start();
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(service.submit(createVector("10.0.5.1", 1.0)));
    }
    service.stop();

    auto metrics = service.get_metrics();
    EXPECT_GE(metrics.cancelled, 4u);
    EXPECT_EQ(metrics.completed + metrics.failed + metrics.cancelled, 5u);
    EXPECT_FALSE(service.is_running());
}

TEST_F(AsyncScorerTest, StopReleasesConcurrentDrain)
{
    auto scorer = std::make_shared<SlowScorer>(5ms, 1.0);
    for (int round = 0; round < 20; ++round)
    {
        AsyncScoringService service(scorer, collector(), 1, 16, 5000ms);
        service.start();
        for (int i = 0; i < 3; ++i)
        {
            ASSERT_TRUE(service.submit(createVector("10.0.5.2", 1.0)));
        }

        auto drained = std::async(std::launch::async, [&service]() { service.drain(); });
        service.stop();
        ASSERT_EQ(drained.wait_for(2s), std::future_status::ready) << "round " << round;
        EXPECT_FALSE(service.is_running());
    }
}
