#pragma once

#include <map>
#include <string>
#include <vector>

#include "quant_types.hpp"

// "Sunday", "Monday", ... for weekday 0..6; empty for anything else.
const char* weekdayName(int weekday);

// Busiest heatmap cell of each person as a two hour window, e.g.
// "Sundays 21:00-23:00", plus their median response time.
std::map<std::string, BestTimeToText> computeBestTimeToText(const HeatmapData& heatmap,
                                                            const TimingMetrics& timing,
                                                            const std::vector<std::string>& names);
