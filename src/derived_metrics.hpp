#pragma once

#include "accumulator.hpp"
#include "conversation.hpp"
#include "quant_types.hpp"

// Turns finalized accumulators into the public metric structures.
// None of these touch the raw message list.

PersonMetrics buildPersonMetrics(const PersonAccumulator& acc);
ResponseTimeStats buildResponseTimeStats(const PersonAccumulator& acc);

TimingMetrics     buildTimingMetrics(const ConversationAccumulators& accs);
EngagementMetrics buildEngagementMetrics(const ConversationAccumulators& accs, Platform platform);
PatternMetrics    buildPatternMetrics(const ConversationAccumulators& accs);
HeatmapData       buildHeatmapData(const ConversationAccumulators& accs);
TrendData         buildTrendData(const ConversationAccumulators& accs);
