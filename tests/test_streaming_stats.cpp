#include "streaming_stats.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <set>

TEST(RunningVarianceTest, PopulationMeanAndDeviation)
{
    RunningVariance rv;
    for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0})
    {
        rv.add(v);
    }

    EXPECT_EQ(rv.count(), 8u);
    EXPECT_NEAR(rv.mean(), 5.0, 1e-12);
    EXPECT_NEAR(rv.variance(), 4.0, 1e-12);
    EXPECT_NEAR(rv.stddev(), 2.0, 1e-12);
}

TEST(RunningVarianceTest, SingleValueHasNoSpread)
{
    RunningVariance rv;
    rv.add(42.0);
    EXPECT_DOUBLE_EQ(rv.mean(), 42.0);
    EXPECT_DOUBLE_EQ(rv.variance(), 0.0);

    rv.reset();
    EXPECT_EQ(rv.count(), 0u);
    EXPECT_DOUBLE_EQ(rv.mean(), 0.0);
}

TEST(PortReservoirTest, KeepsEverythingUntilFull)
{
    std::mt19937_64 rng(1);
    PortReservoir reservoir(5);
    for (uint16_t port = 1000; port < 1003; ++port)
    {
        reservoir.add(port, rng);
    }

    ASSERT_EQ(reservoir.samples().size(), 3u);
    EXPECT_EQ(reservoir.samples()[0], 1000);
    EXPECT_EQ(reservoir.samples()[2], 1002);
}

TEST(PortReservoirTest, NeverExceedsCapacity)
{
    std::mt19937_64 rng(7);
    PortReservoir reservoir(5);
    for (uint16_t port = 0; port < 100; ++port)
    {
        reservoir.add(port, rng);
    }

    EXPECT_EQ(reservoir.samples().size(), 5u);
    EXPECT_EQ(reservoir.seen(), 100u);
    std::set<uint16_t> distinct(reservoir.samples().begin(), reservoir.samples().end());
    EXPECT_EQ(distinct.size(), 5u);
    for (uint16_t port : reservoir.samples())
    {
        EXPECT_LT(port, 100);
    }
}

TEST(PortReservoirTest, SameSeedSameSample)
{
    std::mt19937_64 rng_a(42);
    std::mt19937_64 rng_b(42);
    PortReservoir a(10);
    PortReservoir b(10);
    for (uint16_t port = 0; port < 500; ++port)
    {
        a.add(port, rng_a);
        b.add(port, rng_b);
    }
    EXPECT_EQ(a.samples(), b.samples());
}

TEST(EntropyTest, UniformDistribution)
{
    std::vector<uint16_t> samples = {1, 2, 3, 4, 1, 2, 3, 4};
    EXPECT_NEAR(shannon_entropy(samples), 2.0, 1e-12);
}

TEST(EntropyTest, DegenerateInputs)
{
    EXPECT_DOUBLE_EQ(shannon_entropy({}), 0.0);
    EXPECT_DOUBLE_EQ(shannon_entropy({80}), 0.0);
    EXPECT_DOUBLE_EQ(shannon_entropy({80, 80, 80, 80}), 0.0);
}

TEST(EntropyTest, SkewedDistribution)
{
    // p = 2/3, 1/3
    std::vector<uint16_t> samples = {1000, 1001, 1000};
    double expected = -(2.0 / 3.0) * std::log2(2.0 / 3.0) - (1.0 / 3.0) * std::log2(1.0 / 3.0);
    EXPECT_NEAR(shannon_entropy(samples), expected, 1e-12);
}

TEST(EntropyTest, CappedReservoirBoundsEntropy)
{
    // Every port distinct: entropy is bounded by the sample count, not the traffic
    std::mt19937_64 rng(42);
    PortReservoir reservoir(40);
    for (uint32_t port = 0; port < 10000; ++port)
    {
        reservoir.add(static_cast<uint16_t>(port), rng);
    }

    double entropy = shannon_entropy(reservoir.samples());
    EXPECT_GT(entropy, 0.0);
    EXPECT_LE(entropy, std::log2(40.0) + 1e-12);
}

TEST(SeriesTest, MeanAndPopulationDeviation)
{
    std::vector<double> values = {10.0, 20.0, 30.0};
    EXPECT_DOUBLE_EQ(series_mean(values), 20.0);
    EXPECT_NEAR(series_stddev(values), std::sqrt(200.0 / 3.0), 1e-12);

    EXPECT_DOUBLE_EQ(series_mean({}), 0.0);
    EXPECT_DOUBLE_EQ(series_stddev({5.0}), 0.0);
}
