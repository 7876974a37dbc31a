#include "json_io.hpp"
#include "analysis_constants.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

using json = nlohmann::json;

static std::string readFileToString(const std::string& filename)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string stringField(const json& obj, const char* key)
{
    if (obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return std::string();
}

static bool boolField(const json& obj, const char* key)
{
    return obj.contains(key) && obj[key].is_boolean() && obj[key].get<bool>();
}

static long long integerField(const json& obj, const char* key, long long fallback)
{
    if (!obj.contains(key))
        return fallback;
    const json& v = obj[key];
    if (v.is_number_integer())
        return v.get<long long>();
    if (v.is_number_float())
    {
        const double d = v.get<double>();
        return std::isfinite(d) && std::fabs(d) < 9.0e18 ? std::llround(d) : fallback;
    }
    return fallback;
}

// Missing or non-numeric timestamps read as 0; numbers outside
// +-MAX_TIMESTAMP_MS are rejected.
static bool timestampField(const json& obj, long long& out)
{
    out = 0;
    if (!obj.contains("timestamp") || !obj["timestamp"].is_number())
        return true;

    const double d = obj["timestamp"].get<double>();
    if (!std::isfinite(d) || std::fabs(d) > static_cast<double>(MAX_TIMESTAMP_MS))
        return false;
    out = std::llround(d);
    return true;
}

static bool parseMessage(const json& m, std::size_t index, Message& msg, std::string& errorOut)
{
    msg.sender = stringField(m, "sender");
    if (msg.sender.empty())
        msg.sender = "Unknown";

    if (!timestampField(m, msg.timestampMs))
    {
        errorOut = "Message " + std::to_string(index) + " has a timestamp out of range.";
        return false;
    }
    msg.content = stringField(m, "content");

    if (m.contains("reactions") && m["reactions"].is_array())
    {
        for (const auto& r : m["reactions"])
        {
            if (!r.is_object())
                continue;
            Reaction reaction;
            reaction.emoji = stringField(r, "emoji");
            reaction.actor = stringField(r, "actor");
            if (reaction.actor.empty())
                continue;
            msg.reactions.push_back(std::move(reaction));
        }
    }

    msg.hasMedia = boolField(m, "hasMedia");
    msg.hasLink  = boolField(m, "hasLink");
    msg.isUnsent = boolField(m, "isUnsent");

    if (m.contains("mentions") && m["mentions"].is_array())
    {
        for (const auto& name : m["mentions"])
        {
            if (name.is_string())
                msg.mentions.push_back(name.get<std::string>());
        }
    }

    msg.replyToIndex = integerField(m, "replyToIndex", -1);
    if (msg.replyToIndex < 0)
        msg.replyToIndex = -1;

    return true;
}

bool parseConversationJson(const std::string& text, Conversation& out, std::string& errorOut)
{
    try
    {
        json j = json::parse(text);
        if (!j.is_object())
        {
            errorOut = "Conversation JSON must be an object.";
            return false;
        }
        if (!j.contains("messages") || !j["messages"].is_array())
        {
            errorOut = "Conversation JSON has no \"messages\" array.";
            return false;
        }

        Conversation conv;
        conv.platform = platformFromString(stringField(j, "platform"));
        conv.title    = stringField(j, "title");

        std::size_t index = 0;
        for (const auto& m : j["messages"])
        {
            if (!m.is_object())
            {
                std::cerr << "ConversationLoader: skipping message " << index
                          << " (not an object)\n";
                ++index;
                continue;
            }
            Message msg;
            if (!parseMessage(m, index, msg, errorOut))
                return false;
            conv.messages.push_back(std::move(msg));
            ++index;
        }

        if (j.contains("participants") && j["participants"].is_array())
        {
            for (const auto& p : j["participants"])
            {
                Participant participant;
                if (p.is_string())
                {
                    participant.name = p.get<std::string>();
                }
                else if (p.is_object())
                {
                    participant.name       = stringField(p, "name");
                    participant.platformId = stringField(p, "platformId");
                }
                conv.participants.push_back(std::move(participant));
            }
        }
        else
        {
            std::unordered_set<std::string> seen;
            for (const Message& msg : conv.messages)
            {
                if (seen.insert(msg.sender).second)
                {
                    Participant participant;
                    participant.name = msg.sender;
                    conv.participants.push_back(std::move(participant));
                }
            }
        }

        if (j.contains("isGroup") && j["isGroup"].is_boolean())
            conv.isGroup = j["isGroup"].get<bool>();
        else
            conv.isGroup = conv.participants.size() > 2;

        out = std::move(conv);
        errorOut.clear();
        return true;
    }
    catch (const std::exception& ex)
    {
        errorOut = ex.what();
        return false;
    }
}

bool loadConversationFromJsonFile(const std::string& path, Conversation& out, std::string& errorOut)
{
    if (path.empty())
    {
        errorOut = "Input path is empty.";
        return false;
    }

    std::string contents;
    try
    {
        contents = readFileToString(path);
    }
    catch (const std::exception& ex)
    {
        errorOut = ex.what();
        return false;
    }

    if (!parseConversationJson(contents, out, errorOut))
    {
        errorOut = path + ": " + errorOut;
        return false;
    }
    return true;
}

// -------------------------------------------------------------
// Output
// -------------------------------------------------------------

void to_json(json& j, const MessageRecord& v)
{
    j = json{
        {"content",   v.content},
        {"wordCount", v.wordCount},
        {"timestamp", v.timestampMs}
    };
}

void to_json(json& j, const CountEntry& v)
{
    j = json{{"key", v.key}, {"count", v.count}};
}

void to_json(json& j, const PersonMetrics& v)
{
    j = json{
        {"totalMessages",        v.totalMessages},
        {"totalWords",           v.totalWords},
        {"totalCharacters",      v.totalCharacters},
        {"averageMessageLength", v.averageMessageLength},
        {"averageMessageChars",  v.averageMessageChars},
        {"longestMessage",       v.longestMessage},
        {"shortestMessage",      v.shortestMessage},
        {"messagesWithEmoji",    v.messagesWithEmoji},
        {"emojiCount",           v.emojiCount},
        {"topEmojis",            v.topEmojis},
        {"questionsAsked",       v.questionsAsked},
        {"mediaShared",          v.mediaShared},
        {"linksShared",          v.linksShared},
        {"unsentMessages",       v.unsentMessages},
        {"reactionsGiven",       v.reactionsGiven},
        {"reactionsReceived",    v.reactionsReceived},
        {"topReactionsGiven",    v.topReactionsGiven},
        {"topWords",             v.topWords},
        {"topPhrases",           v.topPhrases},
        {"uniqueWords",          v.uniqueWords},
        {"vocabularyRichness",   v.vocabularyRichness},
        {"questionsAskedPer1k",  v.questionsAskedPer1k},
        {"mediaSharedPer1k",     v.mediaSharedPer1k},
        {"linksSharedPer1k",     v.linksSharedPer1k},
        {"emojiRatePer1k",       v.emojiRatePer1k},
        {"mentionsMade",         v.mentionsMade},
        {"mentionsReceived",     v.mentionsReceived},
        {"repliesSent",          v.repliesSent},
        {"repliesReceived",      v.repliesReceived}
    };
}

void to_json(json& j, const ResponseTimeStats& v)
{
    j = json{
        {"averageResponseTimeMs", v.averageResponseTimeMs},
        {"medianResponseTimeMs",  v.medianResponseTimeMs},
        {"fastestResponseMs",     v.fastestResponseMs},
        {"slowestResponseMs",     v.slowestResponseMs},
        {"responseTimeTrend",     v.responseTimeTrend},
        {"sampleSize",            v.sampleSize},
        {"trimmedMeanMs",         v.trimmedMeanMs},
        {"stdDevMs",              v.stdDevMs},
        {"q1Ms",                  v.q1Ms},
        {"q3Ms",                  v.q3Ms},
        {"iqrMs",                 v.iqrMs},
        {"p75Ms",                 v.p75Ms},
        {"p90Ms",                 v.p90Ms},
        {"p95Ms",                 v.p95Ms},
        {"skewness",              v.skewness}
    };
}

void to_json(json& j, const LongestSilence& v)
{
    j = json{
        {"durationMs",     v.durationMs},
        {"startTimestamp", v.startTimestampMs},
        {"endTimestamp",   v.endTimestampMs},
        {"lastSender",     v.lastSender},
        {"nextSender",     v.nextSender}
    };
}

void to_json(json& j, const TimingMetrics& v)
{
    j = json{
        {"perPerson",               v.perPerson},
        {"conversationInitiations", v.conversationInitiations},
        {"conversationEndings",     v.conversationEndings},
        {"lateNightMessages",       v.lateNightMessages},
        {"longestSilence",          v.longestSilence}
    };
}

void to_json(json& j, const EngagementMetrics& v)
{
    j = json{
        {"doubleTexts",           v.doubleTexts},
        {"maxConsecutive",        v.maxConsecutive},
        {"messageRatio",          v.messageRatio},
        {"reactionRate",          v.reactionRate},
        {"reactionGiveRate",      v.reactionGiveRate},
        {"reactionReceiveRate",   v.reactionReceiveRate},
        {"mentionRate",           v.mentionRate},
        {"replyRate",             v.replyRate},
        {"hasMentionReplyRates",  v.hasMentionReplyRates},
        {"avgConversationLength", v.avgConversationLength},
        {"totalSessions",         v.totalSessions}
    };
}

void to_json(json& j, const MonthlyVolumePoint& v)
{
    j = json{{"month", v.month}, {"perPerson", v.perPerson}, {"total", v.total}};
}

void to_json(json& j, const BurstPeriod& v)
{
    j = json{
        {"startDate",    v.startDate},
        {"endDate",      v.endDate},
        {"messageCount", v.messageCount},
        {"avgDaily",     v.avgDaily}
    };
}

void to_json(json& j, const PatternMetrics& v)
{
    j = json{
        {"monthlyVolume",   v.monthlyVolume},
        {"weekdayMessages", v.weekdayMessages},
        {"weekendMessages", v.weekendMessages},
        {"volumeTrend",     v.volumeTrend},
        {"bursts",          v.bursts}
    };
}

void to_json(json& j, const HeatmapData& v)
{
    j = json{{"perPerson", v.perPerson}, {"combined", v.combined}};
}

void to_json(json& j, const MonthlySeriesPoint& v)
{
    j = json{{"month", v.month}, {"perPerson", v.perPerson}};
}

void to_json(json& j, const TrendData& v)
{
    j = json{
        {"responseTimeTrend",  v.responseTimeTrend},
        {"messageLengthTrend", v.messageLengthTrend},
        {"initiationTrend",    v.initiationTrend},
        {"responseTimeSlope",  v.responseTimeSlope},
        {"messageLengthSlope", v.messageLengthSlope},
        {"initiationSlope",    v.initiationSlope}
    };
}

void to_json(json& j, const ReciprocityIndex& v)
{
    j = json{
        {"overall",              v.overall},
        {"messageBalance",       v.messageBalance},
        {"initiationBalance",    v.initiationBalance},
        {"responseTimeSymmetry", v.responseTimeSymmetry},
        {"reactionBalance",      v.reactionBalance}
    };
}

void to_json(json& j, const NetworkNode& v)
{
    j = json{{"name", v.name}, {"totalMessages", v.totalMessages}, {"centrality", v.centrality}};
}

void to_json(json& j, const NetworkEdge& v)
{
    j = json{
        {"from",        v.from},
        {"to",          v.to},
        {"weight",      v.weight},
        {"fromToCount", v.fromToCount},
        {"toFromCount", v.toFromCount}
    };
}

void to_json(json& j, const NetworkMetrics& v)
{
    j = json{
        {"nodes",         v.nodes},
        {"edges",         v.edges},
        {"density",       v.density},
        {"mostConnected", v.mostConnected}
    };
}

void to_json(json& j, const CompatibilityBreakdown& v)
{
    j = json{
        {"activityOverlap",   v.activityOverlap},
        {"responseSymmetry",  v.responseSymmetry},
        {"messageBalance",    v.messageBalance},
        {"engagementBalance", v.engagementBalance},
        {"lengthMatch",       v.lengthMatch},
        {"score",             v.score}
    };
}

void to_json(json& j, const GhostRisk& v)
{
    j = json{
        {"score",              v.score},
        {"factors",            v.factors},
        {"responseTimeScore",  v.responseTimeScore},
        {"messageLengthScore", v.messageLengthScore},
        {"initiationScore",    v.initiationScore},
        {"volumeScore",        v.volumeScore}
    };
}

void to_json(json& j, const ViralScores& v)
{
    j = json{
        {"compatibilityScore", v.compatibility.score},
        {"compatibility",      v.compatibility},
        {"interestScores",     v.interestScores},
        {"ghostRisk",          v.ghostRisk},
        {"delusionScore",      v.delusionScore}
    };
    if (v.delusionHolder)
        j["delusionHolder"] = *v.delusionHolder;
    else
        j["delusionHolder"] = nullptr;
}

void to_json(json& j, const BestTimeToText& v)
{
    j = json{
        {"bestDay",       v.bestDay},
        {"bestHour",      v.bestHour},
        {"bestWindow",    v.bestWindow},
        {"avgResponseMs", v.avgResponseMs}
    };
}

void to_json(json& j, const CatchphraseEntry& v)
{
    j = json{{"phrase", v.phrase}, {"count", v.count}, {"uniqueness", v.uniqueness}};
}

void to_json(json& j, const QuantitativeAnalysis& v)
{
    j = json{
        {"participants",     v.participants},
        {"perPerson",        v.perPerson},
        {"timing",           v.timing},
        {"engagement",       v.engagement},
        {"patterns",         v.patterns},
        {"heatmap",          v.heatmap},
        {"trends",           v.trends},
        {"reciprocityIndex", v.reciprocityIndex},
        {"viralScores",      v.viralScores},
        {"bestTimeToText",   v.bestTimeToText},
        {"catchphrases",     v.catchphrases}
    };
    if (v.networkMetrics)
        j["networkMetrics"] = *v.networkMetrics;
    else
        j["networkMetrics"] = nullptr;
}
