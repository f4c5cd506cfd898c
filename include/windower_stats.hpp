#ifndef WINDOWER_STATS_H
#define WINDOWER_STATS_H

#include <istream>
#include <map>
#include <optional>
#include <string>
#include "async_scorer.hpp"
#include "mitigation_engine.hpp"
#include "windower_pipeline.hpp"

// Stats file shared by the inspector and the metrics exporter: one
// `key:value` pair per line, `#` lines are comments.
std::string render_windower_stats(const PipelineCounters& pipeline,
                                  const MitigationEngine::Metrics& mitigation,
                                  const std::optional<AsyncScoringService::Metrics>& scorer);

// Unparseable values are skipped
std::map<std::string, double> parse_windower_stats(std::istream& in);

#endif // WINDOWER_STATS_H
