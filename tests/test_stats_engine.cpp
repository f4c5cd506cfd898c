#include "stats_engine.hpp"
#include "test_helpers.hpp"
#include "windower_config.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <vector>

class StatsEngineTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        engine = std::make_unique<StatsEngine>(2.0);
    }

    std::unique_ptr<StatsEngine> engine;

    // Three windows with a missing window between the last two
    std::vector<WindowRecord> createGappedTail()
    {
        std::vector<WindowRecord> tail = {
            createWindow("192.168.5.5", 0, 10, 2.0),
            createWindow("192.168.5.5", 1, 20, 2.0),
            createWindow("192.168.5.5", 3, 30, 2.0),
        };
        tail[0].pkt_size_min = 60;
        tail[2].pkt_size_max = 1500;
        tail[1].pkt_size_avg = 400.0;
        tail[0].port_src_entropy = 1.0;
        tail[1].port_src_entropy = 2.0;
        tail[2].port_src_entropy = 3.0;
        return tail;
    }
};

TEST_F(StatsEngineTest, SummarizeIsIdempotent)
{
    auto tail = createGappedTail();
    FeatureVector first = engine->summarize(tail, 7);
    FeatureVector second = engine->summarize(tail, 7);

    EXPECT_EQ(first.to_row(), second.to_row());
    EXPECT_EQ(first.src_ip, second.src_ip);
    EXPECT_EQ(first.window_id, second.window_id);
}

TEST_F(StatsEngineTest, RatesCoverGapsInTheTail)
{
    FeatureVector fv = engine->summarize(createGappedTail());

    EXPECT_EQ(fv.window_count, 3u);
    EXPECT_EQ(fv.window_span, 4u);
    // 60 packets over 4 windows of 2 s
    EXPECT_DOUBLE_EQ(fv.pkt_rate, 7.5);
    EXPECT_DOUBLE_EQ(fv.byte_rate, 750.0);
}

TEST_F(StatsEngineTest, MeansAndDeviationsAcrossWindows)
{
    FeatureVector fv = engine->summarize(createGappedTail());

    EXPECT_DOUBLE_EQ(fv.pkts_total, 20.0);
    EXPECT_NEAR(fv.pkts_total_std, std::sqrt(200.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(fv.bytes_total, 2000.0);
    EXPECT_DOUBLE_EQ(fv.port_src_entropy, 2.0);
    EXPECT_NEAR(fv.port_src_entropy_std, std::sqrt(2.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(fv.pkt_size_avg, 200.0);

    EXPECT_DOUBLE_EQ(fv.pkt_size_min, 60.0);
    EXPECT_DOUBLE_EQ(fv.pkt_size_max, 1500.0);
}

TEST_F(StatsEngineTest, ActivityRatios)
{
    FeatureVector fv = engine->summarize(createGappedTail(), 8);
    EXPECT_DOUBLE_EQ(fv.intrawindow_activity_ratio, 0.75);
    EXPECT_DOUBLE_EQ(fv.interwindow_activity_ratio, 3.0 / 8.0);

    // Without a longer recorded history the tail's own span is used
    FeatureVector own_span = engine->summarize(createGappedTail());
    EXPECT_DOUBLE_EQ(own_span.interwindow_activity_ratio, 0.75);
}

TEST_F(StatsEngineTest, ActiveTimeRatioMeasuresSendingTime)
{
    auto tail = createGappedTail();
    // Full first window, then two half-second bursts
    tail[1].first_packet_ts = 2.5;
    tail[1].last_packet_ts = 3.0;
    tail[2].first_packet_ts = 6.0;
    tail[2].last_packet_ts = 6.5;

    FeatureVector fv = engine->summarize(tail);
    EXPECT_DOUBLE_EQ(fv.intrawindow_active_time_ratio, 0.5);
    EXPECT_DOUBLE_EQ(fv.intrawindow_activity_ratio, 0.75);
    EXPECT_DOUBLE_EQ(fv.intrawindow_activity_ratio,
                     static_cast<double>(fv.window_count) / static_cast<double>(fv.window_span));
}

TEST_F(StatsEngineTest, NonPositiveWindowLengthIsRejected)
{
    EXPECT_THROW(StatsEngine(0.0), ConfigError);
    EXPECT_THROW(StatsEngine(-2.0), ConfigError);
}

TEST_F(StatsEngineTest, DominantProtocolDeviation)
{
    auto tail = createGappedTail();
    // UDP carries most packets overall
    tail[0].tcp_pkt_count = 10;
    tail[0].udp_pkt_count = 0;
    tail[0].proto_tcp_share = 1.0;
    tail[0].proto_udp_share = 0.0;
    tail[1].tcp_pkt_count = 0;
    tail[1].udp_pkt_count = 20;
    tail[1].proto_tcp_share = 0.0;
    tail[1].proto_udp_share = 1.0;
    tail[2].tcp_pkt_count = 15;
    tail[2].udp_pkt_count = 15;
    tail[2].proto_tcp_share = 0.5;
    tail[2].proto_udp_share = 0.5;

    FeatureVector fv = engine->summarize(tail);
    // UDP shares 0, 1, 0.5
    EXPECT_NEAR(fv.dominant_proto_ratio_std, std::sqrt(1.0 / 6.0), 1e-12);
}

TEST_F(StatsEngineTest, DominantProtocolTiePrefersTcp)
{
    auto tail = createGappedTail();
    for (auto &rec : tail)
    {
        rec.tcp_pkt_count = 5;
        rec.udp_pkt_count = 5;
        rec.proto_tcp_share = 0.5;
    }
    tail[0].proto_udp_share = 0.1;
    tail[1].proto_udp_share = 0.5;
    tail[2].proto_udp_share = 0.9;

    // Constant TCP shares: picking UDP would give a nonzero deviation
    FeatureVector fv = engine->summarize(tail);
    EXPECT_NEAR(fv.dominant_proto_ratio_std, 0.0, 1e-12);
}

TEST_F(StatsEngineTest, NewestWindowIdentifiesTheVector)
{
    FeatureVector fv = engine->summarize(createGappedTail());
    EXPECT_EQ(fv.src_ip, "192.168.5.5");
    EXPECT_EQ(fv.window_id, 3);
    EXPECT_DOUBLE_EQ(fv.emitted_at, 8.0);
}

TEST_F(StatsEngineTest, EmptyTailYieldsEmptyVector)
{
    FeatureVector fv = engine->summarize({});
    EXPECT_TRUE(fv.src_ip.empty());
    EXPECT_EQ(fv.window_count, 0u);
    EXPECT_DOUBLE_EQ(fv.pkt_rate, 0.0);
}

TEST(FeatureVectorTest, NamesMatchRowOrder)
{
    FeatureVector fv;
    fv.pkt_rate = 12.5;
    fv.interwindow_activity_ratio = 0.25;
    fv.intrawindow_active_time_ratio = 0.125;

    const auto &names = FeatureVector::feature_names();
    const auto row = fv.to_row();
    ASSERT_EQ(names.size(), row.size());

    EXPECT_DOUBLE_EQ(row[FeatureVector::feature_index("pkt_rate")], 12.5);
    EXPECT_DOUBLE_EQ(row[FeatureVector::feature_index("interwindow_activity_ratio")], 0.25);
    EXPECT_DOUBLE_EQ(row[FeatureVector::feature_index("intrawindow_active_time_ratio")], 0.125);
    EXPECT_EQ(FeatureVector::feature_index("src_ip"), -1);
    EXPECT_EQ(FeatureVector::feature_index("window_span"), -1);
}
