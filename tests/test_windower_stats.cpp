#include "windower_stats.hpp"
#include <gtest/gtest.h>
#include <sstream>

TEST(WindowerStatsTest, RenderedFileParsesBack)
{
    PipelineCounters pipeline;
    pipeline.packets_processed = 1200;
    pipeline.windows_finalized = 72;
    pipeline.vectors_emitted = 32;
    pipeline.scorer_dropped = 2;

    MitigationEngine::Metrics mitigation{};
    mitigation.pkts_allowed = 800;
    mitigation.pkts_denied = 400;
    mitigation.denylisted_sources = 8;

    const std::string text = render_windower_stats(pipeline, mitigation, std::nullopt);
    EXPECT_EQ(text.rfind("# ", 0), 0u);

    std::istringstream in(text);
    auto stats = parse_windower_stats(in);
    EXPECT_DOUBLE_EQ(stats.at("packets_processed"), 1200.0);
    EXPECT_DOUBLE_EQ(stats.at("packets_allowed"), 800.0);
    EXPECT_DOUBLE_EQ(stats.at("packets_denied"), 400.0);
    EXPECT_DOUBLE_EQ(stats.at("windows_finalized"), 72.0);
    EXPECT_DOUBLE_EQ(stats.at("vectors_emitted"), 32.0);
    EXPECT_DOUBLE_EQ(stats.at("denylisted_sources"), 8.0);
    EXPECT_DOUBLE_EQ(stats.at("scorer_dropped"), 2.0);
    EXPECT_EQ(stats.count("scorer_completed"), 0u);
}

TEST(WindowerStatsTest, ScorerSectionOnlyWithAsyncScoring)
{
    AsyncScoringService::Metrics scorer{};
    scorer.completed = 31;
    scorer.timed_out = 1;
    scorer.queue_depth = 3;

    std::istringstream in(render_windower_stats(PipelineCounters{}, MitigationEngine::Metrics{}, scorer));
    auto stats = parse_windower_stats(in);
    EXPECT_DOUBLE_EQ(stats.at("scorer_completed"), 31.0);
    EXPECT_DOUBLE_EQ(stats.at("scorer_timed_out"), 1.0);
    EXPECT_DOUBLE_EQ(stats.at("scorer_queue_depth"), 3.0);
}

TEST(WindowerStatsTest, ParserSkipsCommentsAndGarbage)
{
    std::istringstream in(
        "# header: with a colon\n"
        "\n"
        "packets_denied:12\n"
        "no delimiter here\n"
        "vectors_emitted:many\n"
        "windows_open: 4\n");

    auto stats = parse_windower_stats(in);
    EXPECT_EQ(stats.size(), 2u);
    EXPECT_DOUBLE_EQ(stats.at("packets_denied"), 12.0);
    EXPECT_DOUBLE_EQ(stats.at("windows_open"), 4.0);
}
