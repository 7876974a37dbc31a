#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Output of the quantitative engine. Built once per call and handed out by
// value; nothing in here is mutated after computeQuantitativeAnalysis returns.

// [weekday 0=Sunday][hour 0..23]
using HeatmapGrid = std::array<std::array<long long, 24>, 7>;

struct MessageRecord
{
    std::string content;
    long long   wordCount   = 0;
    long long   timestampMs = 0;
};

struct CountEntry
{
    std::string key;   // emoji, word or phrase
    long long   count = 0;
};

struct PersonMetrics
{
    long long totalMessages   = 0;
    long long totalWords      = 0;
    long long totalCharacters = 0;
    double averageMessageLength = 0.0; // words
    double averageMessageChars  = 0.0;

    MessageRecord longestMessage;
    MessageRecord shortestMessage;

    long long messagesWithEmoji = 0;
    long long emojiCount        = 0;
    std::vector<CountEntry> topEmojis;

    long long questionsAsked = 0;
    long long mediaShared    = 0;
    long long linksShared    = 0;
    long long unsentMessages = 0;

    long long reactionsGiven    = 0;
    long long reactionsReceived = 0;
    std::vector<CountEntry> topReactionsGiven;

    std::vector<CountEntry> topWords;
    std::vector<CountEntry> topPhrases;
    long long uniqueWords = 0;
    double vocabularyRichness = 0.0;

    // per 1000 messages
    double questionsAskedPer1k = 0.0;
    double mediaSharedPer1k    = 0.0;
    double linksSharedPer1k    = 0.0;
    double emojiRatePer1k      = 0.0;

    long long mentionsMade     = 0;
    long long mentionsReceived = 0;
    long long repliesSent      = 0;
    long long repliesReceived  = 0;
};

struct ResponseTimeStats
{
    double averageResponseTimeMs = 0.0;
    double medianResponseTimeMs  = 0.0;
    double fastestResponseMs     = 0.0;
    double slowestResponseMs     = 0.0;
    // slope of monthly averages, ms per month; positive = getting slower
    double responseTimeTrend     = 0.0;

    long long sampleSize = 0;
    double trimmedMeanMs = 0.0;
    double stdDevMs      = 0.0;
    double q1Ms  = 0.0;
    double q3Ms  = 0.0;
    double iqrMs = 0.0;
    double p75Ms = 0.0;
    double p90Ms = 0.0;
    double p95Ms = 0.0;
    double skewness = 0.0;
};

struct LongestSilence
{
    long long   durationMs       = 0;
    long long   startTimestampMs = 0;
    long long   endTimestampMs   = 0;
    std::string lastSender;
    std::string nextSender;
};

struct TimingMetrics
{
    std::map<std::string, ResponseTimeStats> perPerson;
    std::map<std::string, long long> conversationInitiations;
    std::map<std::string, long long> conversationEndings;
    std::map<std::string, long long> lateNightMessages;
    LongestSilence longestSilence;
};

struct EngagementMetrics
{
    std::map<std::string, long long> doubleTexts;
    std::map<std::string, long long> maxConsecutive;
    std::map<std::string, double>    messageRatio;

    // reactions given / messages received from others
    std::map<std::string, double> reactionRate;
    std::map<std::string, double> reactionGiveRate;
    // reactions received / own messages
    std::map<std::string, double> reactionReceiveRate;

    // mentions made / own messages, replies sent / own messages
    std::map<std::string, double> mentionRate;
    std::map<std::string, double> replyRate;
    // Only platforms with native mentions/replies carry meaningful rates.
    bool hasMentionReplyRates = false;

    double    avgConversationLength = 0.0;
    long long totalSessions         = 0;
};

struct MonthlyVolumePoint
{
    std::string month; // YYYY-MM
    std::map<std::string, long long> perPerson;
    long long total = 0;
};

struct BurstPeriod
{
    std::string startDate; // YYYY-MM-DD
    std::string endDate;
    long long   messageCount = 0;
    double      avgDaily     = 0.0;
};

struct PatternMetrics
{
    std::vector<MonthlyVolumePoint> monthlyVolume;
    std::map<std::string, long long> weekdayMessages;
    std::map<std::string, long long> weekendMessages;
    double volumeTrend = 0.0;
    std::vector<BurstPeriod> bursts;
};

struct HeatmapData
{
    std::map<std::string, HeatmapGrid> perPerson;
    HeatmapGrid combined{};
};

struct MonthlySeriesPoint
{
    std::string month;
    std::map<std::string, double> perPerson;
};

struct TrendData
{
    std::vector<MonthlySeriesPoint> responseTimeTrend;  // mean ms per month
    std::vector<MonthlySeriesPoint> messageLengthTrend; // mean words per month
    std::vector<MonthlySeriesPoint> initiationTrend;    // initiations per month

    // Regression slopes per person. Months without data are skipped for the
    // response time and length series; initiations keep their zero months.
    std::map<std::string, double> responseTimeSlope;
    std::map<std::string, double> messageLengthSlope;
    std::map<std::string, double> initiationSlope;
};

struct ReciprocityIndex
{
    double overall              = 50.0;
    double messageBalance       = 50.0;
    double initiationBalance    = 50.0;
    double responseTimeSymmetry = 50.0;
    double reactionBalance      = 50.0;
};

struct NetworkNode
{
    std::string name;
    long long   totalMessages = 0;
    double      centrality    = 0.0;
};

struct NetworkEdge
{
    std::string from;
    std::string to;
    long long   weight      = 0;
    long long   fromToCount = 0; // `to` answered `from`
    long long   toFromCount = 0; // `from` answered `to`
};

struct NetworkMetrics
{
    std::vector<NetworkNode> nodes;
    std::vector<NetworkEdge> edges;
    double      density = 0.0;
    std::string mostConnected;
};

struct CompatibilityBreakdown
{
    double activityOverlap   = 0.0;
    double responseSymmetry  = 0.0;
    double messageBalance    = 0.0;
    double engagementBalance = 0.0;
    double lengthMatch       = 0.0;
    double score             = 0.0;
};

struct GhostRisk
{
    double score = 0.0;
    std::vector<std::string> factors;

    double responseTimeScore  = 0.0;
    double messageLengthScore = 0.0;
    double initiationScore    = 0.0;
    double volumeScore        = 0.0;
};

struct ViralScores
{
    CompatibilityBreakdown compatibility;
    std::map<std::string, double>    interestScores;
    std::map<std::string, GhostRisk> ghostRisk;
    double delusionScore = 0.0;
    std::optional<std::string> delusionHolder;
};

struct BestTimeToText
{
    std::string bestDay;
    int         bestHour = 0;
    std::string bestWindow;
    double      avgResponseMs = 0.0;
};

struct CatchphraseEntry
{
    std::string phrase;
    long long   count      = 0;
    double      uniqueness = 0.0;
};

struct QuantitativeAnalysis
{
    // Declared participants first, then senders/actors first seen mid-stream.
    std::vector<std::string> participants;

    std::map<std::string, PersonMetrics> perPerson;
    TimingMetrics     timing;
    EngagementMetrics engagement;
    PatternMetrics    patterns;
    HeatmapData       heatmap;
    TrendData         trends;

    ReciprocityIndex              reciprocityIndex;
    std::optional<NetworkMetrics> networkMetrics; // group chats only
    ViralScores                   viralScores;

    std::map<std::string, BestTimeToText>                bestTimeToText;
    std::map<std::string, std::vector<CatchphraseEntry>> catchphrases;
};
