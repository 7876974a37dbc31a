#pragma once

#include <map>
#include <string>
#include <vector>

#include "quant_types.hpp"

// Days whose volume exceeds 3x their baseline, merged into periods.
//
// Baseline for day i: the overall daily average while i < 7, afterwards the
// mean of the 7 preceding active days. Burst days at most one calendar day
// apart are merged. Fewer than 8 active days never produce a burst.
std::vector<BurstPeriod> detectBursts(const std::map<std::string, long long>& dailyCounts);
