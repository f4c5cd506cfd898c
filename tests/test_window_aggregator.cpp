#include "test_helpers.hpp"
#include "window_aggregator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

class WindowAggregatorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        aggregator = std::make_unique<WindowAggregator>(1.0, 3, 40, 42);
    }

    std::unique_ptr<WindowAggregator> aggregator;
};

TEST_F(WindowAggregatorTest, WindowIdsFollowWindowLength)
{
    WindowAggregator five_seconds(5.0);
    EXPECT_EQ(five_seconds.window_id_of(0.0), 0);
    EXPECT_EQ(five_seconds.window_id_of(4.999), 0);
    EXPECT_EQ(five_seconds.window_id_of(5.0), 1);
    EXPECT_EQ(five_seconds.window_id_of(12.5), 2);
}

TEST_F(WindowAggregatorTest, CrossingIntoNextWindowFinalizesPrevious)
{
    EXPECT_FALSE(aggregator->observe(createPacket("192.168.1.10", 0.1, 100, TransportProtocol::TCP, 1000)));
    EXPECT_FALSE(aggregator->observe(createPacket("192.168.1.10", 0.3, 200, TransportProtocol::TCP, 1001)));
    EXPECT_FALSE(aggregator->observe(createPacket("192.168.1.10", 0.6, 300, TransportProtocol::TCP, 1000)));

    auto record = aggregator->observe(createPacket("192.168.1.10", 1.2));
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->src_ip, "192.168.1.10");
    EXPECT_EQ(record->window_id, 0);
    EXPECT_DOUBLE_EQ(record->window_start, 0.0);
    EXPECT_DOUBLE_EQ(record->window_end, 1.0);
    EXPECT_DOUBLE_EQ(record->first_packet_ts, 0.1);
    EXPECT_DOUBLE_EQ(record->last_packet_ts, 0.6);

    EXPECT_EQ(record->pkts_total, 3u);
    EXPECT_EQ(record->bytes_total, 600u);
    EXPECT_DOUBLE_EQ(record->pkt_rate, 3.0);
    EXPECT_DOUBLE_EQ(record->byte_rate, 600.0);

    EXPECT_EQ(record->pkt_size_min, 100u);
    EXPECT_EQ(record->pkt_size_max, 300u);
    EXPECT_NEAR(record->pkt_size_avg, 200.0, 1e-9);
    EXPECT_NEAR(record->pkt_size_std, std::sqrt(20000.0 / 3.0), 1e-9);

    EXPECT_NEAR(record->pkt_arrivals_avg, 0.25, 1e-9);
    EXPECT_NEAR(record->pkt_arrivals_std, 0.05, 1e-9);

    EXPECT_EQ(record->tcp_pkt_count, 3u);
    EXPECT_DOUBLE_EQ(record->proto_tcp_share, 1.0);
    EXPECT_EQ(record->port_src_unique, 2u);
    double expected_entropy = -(2.0 / 3.0) * std::log2(2.0 / 3.0) - (1.0 / 3.0) * std::log2(1.0 / 3.0);
    EXPECT_NEAR(record->port_src_entropy, expected_entropy, 1e-12);

    // Two socket pairs carried the three packets
    EXPECT_DOUBLE_EQ(record->conn_pkts_avg, 1.5);

    auto counters = aggregator->counters();
    EXPECT_EQ(counters.windows_finalized, 1u);
    EXPECT_EQ(counters.open_buckets, 1u);
}

TEST_F(WindowAggregatorTest, ProtocolFragmentAndHeaderFeatures)
{
    auto udp1 = createPacket("10.1.1.1", 0.1, 100, TransportProtocol::UDP, 53);
    auto udp2 = createPacket("10.1.1.1", 0.2, 100, TransportProtocol::UDP, 53);
    auto icmp = createPacket("10.1.1.1", 0.3, 100, TransportProtocol::ICMP, std::nullopt, std::nullopt);
    auto other = createPacket("10.1.1.1", 0.4, 100, TransportProtocol::OTHER, std::nullopt, std::nullopt);
    udp1.header_length = 20;
    udp2.header_length = 20;
    icmp.header_length = 20;
    other.header_length = 20;
    other.is_fragment = true;

    for (const auto &pkt : {udp1, udp2, icmp, other})
    {
        EXPECT_FALSE(aggregator->observe(pkt));
    }

    auto records = aggregator->flush();
    ASSERT_EQ(records.size(), 1u);
    const auto &rec = records[0];

    EXPECT_EQ(rec.udp_pkt_count, 2u);
    EXPECT_EQ(rec.icmp_pkt_count, 1u);
    EXPECT_EQ(rec.other_pkt_count, 1u);
    EXPECT_DOUBLE_EQ(rec.proto_udp_share, 0.5);
    EXPECT_DOUBLE_EQ(rec.proto_icmp_share, 0.25);
    EXPECT_DOUBLE_EQ(rec.proto_tcp_share, 0.0);
    EXPECT_EQ(rec.pkts_frag_count, 1u);
    EXPECT_DOUBLE_EQ(rec.pkts_frag_share, 0.25);
    EXPECT_NEAR(rec.hdrs_payload_ratio_avg, 0.2, 1e-12);

    // Portless packets are not sampled
    EXPECT_EQ(rec.port_src_unique, 1u);
    EXPECT_DOUBLE_EQ(rec.port_src_entropy, 0.0);
}

TEST_F(WindowAggregatorTest, SparseWindowIsDiscarded)
{
    (void)aggregator->observe(createPacket("172.16.0.5", 0.1));
    (void)aggregator->observe(createPacket("172.16.0.5", 0.2));

    EXPECT_FALSE(aggregator->observe(createPacket("172.16.0.5", 1.5)).has_value());

    auto counters = aggregator->counters();
    EXPECT_EQ(counters.windows_discarded, 1u);
    EXPECT_EQ(counters.windows_finalized, 0u);
}

TEST_F(WindowAggregatorTest, MalformedPacketsAreSkipped)
{
    auto no_source = createPacket("", 0.1);
    auto empty = createPacket("10.0.0.2", 0.1, 0);
    auto bad_header = createPacket("10.0.0.2", 0.1, 30);
    bad_header.header_length = 60;
    auto bad_time = createPacket("10.0.0.2", std::nan(""));

    for (const auto &pkt : {no_source, empty, bad_header, bad_time})
    {
        EXPECT_TRUE(pkt.is_malformed());
        EXPECT_FALSE(aggregator->observe(pkt));
    }

    auto counters = aggregator->counters();
    EXPECT_EQ(counters.malformed_skipped, 4u);
    EXPECT_EQ(counters.packets_observed, 0u);
    EXPECT_EQ(counters.open_buckets, 0u);
}

TEST_F(WindowAggregatorTest, PacketsForClosedWindowsAreLate)
{
    (void)aggregator->observe(createPacket("10.0.0.3", 1.5));
    // Source already moved on to window 1
    (void)aggregator->observe(createPacket("10.0.0.3", 0.9));
    EXPECT_EQ(aggregator->counters().late_dropped, 1u);

    (void)aggregator->expire(3.0);
    // Windows below 3 are sealed for every source
    (void)aggregator->observe(createPacket("10.0.0.4", 2.5));
    EXPECT_EQ(aggregator->counters().late_dropped, 2u);

    EXPECT_FALSE(aggregator->observe(createPacket("10.0.0.4", 3.1)));
    EXPECT_EQ(aggregator->counters().late_dropped, 2u);
}

TEST_F(WindowAggregatorTest, ExpireClosesQuietSourcesInAddressOrder)
{
    for (double ts : {0.1, 0.2, 0.3})
    {
        (void)aggregator->observe(createPacket("10.0.0.2", ts));
        (void)aggregator->observe(createPacket("10.0.0.1", ts));
    }
    (void)aggregator->observe(createPacket("10.0.0.9", 1.1));

    auto records = aggregator->expire(1.5);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].src_ip, "10.0.0.1");
    EXPECT_EQ(records[1].src_ip, "10.0.0.2");

    // The window 1 bucket is still open
    EXPECT_EQ(aggregator->counters().open_buckets, 1u);
    EXPECT_TRUE(aggregator->expire(1.7).empty());
}

TEST_F(WindowAggregatorTest, FlushClosesEverything)
{
    for (double ts : {5.1, 5.2, 5.3})
    {
        (void)aggregator->observe(createPacket("10.0.0.7", ts));
    }
    (void)aggregator->observe(createPacket("10.0.0.8", 5.4));

    auto records = aggregator->flush();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].src_ip, "10.0.0.7");

    auto counters = aggregator->counters();
    EXPECT_EQ(counters.open_buckets, 0u);
    EXPECT_EQ(counters.windows_discarded, 1u);

    // Anything for the flushed windows now arrives late
    (void)aggregator->observe(createPacket("10.0.0.7", 5.9));
    EXPECT_EQ(aggregator->counters().late_dropped, 1u);
}

TEST_F(WindowAggregatorTest, ReorderedPacketsInsideWindowDoNotProduceNegativeGaps)
{
    (void)aggregator->observe(createPacket("10.0.0.5", 0.5));
    (void)aggregator->observe(createPacket("10.0.0.5", 0.4));
    (void)aggregator->observe(createPacket("10.0.0.5", 0.7));

    auto records = aggregator->flush();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_GE(records[0].pkt_arrivals_avg, 0.0);
    EXPECT_DOUBLE_EQ(records[0].first_packet_ts, 0.5);
    EXPECT_DOUBLE_EQ(records[0].last_packet_ts, 0.7);
}

TEST_F(WindowAggregatorTest, RatesDivideByWindowLength)
{
    WindowAggregator longer(2.5, 1);
    for (double ts : {0.1, 0.6, 1.1, 1.6, 2.1})
    {
        EXPECT_FALSE(longer.observe(createPacket("10.0.2.1", ts)));
    }

    auto records = longer.flush();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pkts_total, 5u);
    EXPECT_DOUBLE_EQ(records[0].window_end, 2.5);
    EXPECT_DOUBLE_EQ(records[0].pkt_rate, 2.0);
    EXPECT_DOUBLE_EQ(records[0].byte_rate, 200.0);
}

TEST_F(WindowAggregatorTest, EntropyIsBoundedByTheDistinctPortCount)
{
    WindowAggregator busy(1.0, 20, 40, 42);
    for (int i = 0; i < 1000; ++i)
    {
        const auto port = static_cast<uint16_t>(5000 + i % 5);
        (void)busy.observe(createPacket("10.0.2.2", i / 1000.0, 100, TransportProtocol::UDP, port));
    }

    auto records = busy.flush();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pkts_total, 1000u);
    EXPECT_EQ(records[0].port_src_unique, 5u);
    EXPECT_GT(records[0].port_src_entropy, 0.0);
    EXPECT_LE(records[0].port_src_entropy, std::log2(5.0) + 1e-12);
}

TEST_F(WindowAggregatorTest, UnrepresentableTimestampsAreSkipped)
{
    EXPECT_FALSE(aggregator->timestamp_in_range(1e19));
    EXPECT_TRUE(aggregator->timestamp_in_range(1.7e9));

    EXPECT_FALSE(aggregator->observe(createPacket("10.0.2.3", 1e19)));
    auto counters = aggregator->counters();
    EXPECT_EQ(counters.malformed_skipped, 1u);
    EXPECT_EQ(counters.open_buckets, 0u);

    // The watermark is untouched, so ordinary traffic still opens windows
    (void)aggregator->observe(createPacket("10.0.2.3", 5.1));
    EXPECT_EQ(aggregator->counters().open_buckets, 1u);
    EXPECT_EQ(aggregator->counters().late_dropped, 0u);
}

TEST(WindowAggregatorLengthTest, NonPositiveLengthIsRejected)
{
    EXPECT_THROW(WindowAggregator(0.0), ConfigError);
    EXPECT_THROW(WindowAggregator(-1.0), ConfigError);
    EXPECT_THROW(WindowAggregator(std::nan("")), ConfigError);
    EXPECT_NO_THROW(WindowAggregator(0.5));
}
