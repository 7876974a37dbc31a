#pragma once

#include <map>
#include <string>
#include <vector>

#include "quant_types.hpp"

// Heuristic composite scores computed from the finished quantitative
// metrics. Each sub-score is its own function so the weights and fallbacks
// can be checked in isolation. Two-party scores use the first two names.

// Sum over 24 hours of min(shareA(h), shareB(h)) * 100. 0 when either side is silent.
double activityOverlapScore(const HeatmapData& heatmap, const std::vector<std::string>& names);

// 100 - |medA - medB| / max * 100; 50 when neither has a median.
double responseSymmetryScore(const TimingMetrics& timing, const std::vector<std::string>& names);

// 100 - |ratioA - 0.5| * 200
double messageBalanceScore(const EngagementMetrics& engagement, const std::vector<std::string>& names);

// min/max of the reaction give rates. When both are 0 and the platform has
// native mentions/replies, the mean of the mention and reply min/max balances.
double engagementBalanceScore(const EngagementMetrics& engagement, const std::vector<std::string>& names);

// 100 - |avgA - avgB| / max * 100 on average words per message; 50 when both are 0.
double lengthMatchScore(const std::map<std::string, PersonMetrics>& perPerson,
                        const std::vector<std::string>& names);

CompatibilityBreakdown computeCompatibility(const QuantitativeAnalysis& q,
                                            const std::vector<std::string>& names);

// Weighted interest of one person in [0, 100]; 0 when they sent nothing.
// `conversationMessages` normalizes the double text rate.
double computeInterestScore(const QuantitativeAnalysis& q, const std::string& name,
                            long long conversationMessages);

// Recent (last 3 months) against earlier months. Fewer than 3 earlier months
// gives score 0 with the single factor "Insufficient data".
GhostRisk computeGhostRisk(const QuantitativeAnalysis& q, const std::string& name);

// |top1 - top2| of the interest scores in declaration order; the holder is the
// lower of the two and is left empty below a 5 point gap.
void computeDelusion(const std::map<std::string, double>& interestScores,
                     const std::vector<std::string>& names,
                     ViralScores& out);

ViralScores computeViralScores(const QuantitativeAnalysis& q,
                               const std::vector<std::string>& names,
                               long long conversationMessages);
