#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "conversation.hpp"
#include "quant_types.hpp"

// -------------------------------------------------------------
// Input: normalized conversation file
// -------------------------------------------------------------
//
// {
//   "platform": "messenger" | "whatsapp" | "instagram" | "telegram" | "discord",
//   "title": "...",
//   "isGroup": false,
//   "participants": [{"name": "...", "platformId": "..."}],
//   "messages": [{"sender": "...", "timestamp": 1700000000000, "content": "...",
//                 "reactions": [{"emoji": "...", "actor": "..."}],
//                 "hasMedia": false, "hasLink": false, "isUnsent": false,
//                 "mentions": ["..."], "replyToIndex": -1}]
// }
//
// Only "messages" is mandatory. Without "participants" the senders are used
// in first-seen order; without "isGroup" a chat with more than two
// participants is a group.
//
// Both loaders return false and fill errorOut instead of throwing.

bool parseConversationJson(const std::string& text, Conversation& out, std::string& errorOut);

bool loadConversationFromJsonFile(const std::string& path, Conversation& out, std::string& errorOut);

// -------------------------------------------------------------
// Output: camelCase JSON of the analysis
// -------------------------------------------------------------

void to_json(nlohmann::json& j, const MessageRecord& v);
void to_json(nlohmann::json& j, const CountEntry& v);
void to_json(nlohmann::json& j, const PersonMetrics& v);
void to_json(nlohmann::json& j, const ResponseTimeStats& v);
void to_json(nlohmann::json& j, const LongestSilence& v);
void to_json(nlohmann::json& j, const TimingMetrics& v);
void to_json(nlohmann::json& j, const EngagementMetrics& v);
void to_json(nlohmann::json& j, const MonthlyVolumePoint& v);
void to_json(nlohmann::json& j, const BurstPeriod& v);
void to_json(nlohmann::json& j, const PatternMetrics& v);
void to_json(nlohmann::json& j, const HeatmapData& v);
void to_json(nlohmann::json& j, const MonthlySeriesPoint& v);
void to_json(nlohmann::json& j, const TrendData& v);
void to_json(nlohmann::json& j, const ReciprocityIndex& v);
void to_json(nlohmann::json& j, const NetworkNode& v);
void to_json(nlohmann::json& j, const NetworkEdge& v);
void to_json(nlohmann::json& j, const NetworkMetrics& v);
void to_json(nlohmann::json& j, const CompatibilityBreakdown& v);
void to_json(nlohmann::json& j, const GhostRisk& v);
void to_json(nlohmann::json& j, const ViralScores& v);
void to_json(nlohmann::json& j, const BestTimeToText& v);
void to_json(nlohmann::json& j, const CatchphraseEntry& v);
void to_json(nlohmann::json& j, const QuantitativeAnalysis& v);
