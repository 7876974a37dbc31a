#pragma once

#include <map>
#include <string>
#include <vector>

#include "quant_types.hpp"

// 100 when `share` is exactly one half, 0 when it is 0 or 1.
double shareBalance(double share);

// Structural balance between the first two declared participants.
// Fewer than two participants yields the neutral default (all 50).
ReciprocityIndex computeReciprocityIndex(const EngagementMetrics& engagement,
                                         const TimingMetrics& timing,
                                         const std::map<std::string, PersonMetrics>& perPerson,
                                         const std::vector<std::string>& declaredNames);
