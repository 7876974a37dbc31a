#include "derived_metrics.hpp"
#include "analysis_constants.hpp"
#include "bursts.hpp"
#include "stats_math.hpp"

#include <algorithm>

static std::vector<CountEntry> toCountEntries(const FrequencyCounter& freq, std::size_t n)
{
    std::vector<CountEntry> out;
    for (const auto& kv : freq.topN(n))
        out.push_back(CountEntry{kv.first, kv.second});
    return out;
}

static double per1k(long long count, long long messages)
{
    return messages > 0 ? static_cast<double>(count) * 1000.0 / static_cast<double>(messages) : 0.0;
}

PersonMetrics buildPersonMetrics(const PersonAccumulator& acc)
{
    PersonMetrics m;
    const double messages = static_cast<double>(acc.totalMessages);

    m.totalMessages   = acc.totalMessages;
    m.totalWords      = acc.totalWords;
    m.totalCharacters = acc.totalCharacters;
    m.averageMessageLength = acc.totalMessages > 0 ? acc.totalWords / messages : 0.0;
    m.averageMessageChars  = acc.totalMessages > 0 ? acc.totalCharacters / messages : 0.0;

    m.longestMessage = acc.longestMessage;
    if (acc.hasShortestMessage)
        m.shortestMessage = acc.shortestMessage;

    m.messagesWithEmoji = acc.messagesWithEmoji;
    m.emojiCount        = acc.emojiCount;
    m.topEmojis         = toCountEntries(acc.emojiFreq, TOP_EMOJIS);

    m.questionsAsked = acc.questionsAsked;
    m.mediaShared    = acc.mediaShared;
    m.linksShared    = acc.linksShared;
    m.unsentMessages = acc.unsentMessages;

    m.reactionsGiven    = acc.reactionsGiven;
    m.reactionsReceived = acc.reactionsReceived;
    m.topReactionsGiven = toCountEntries(acc.reactionsGivenFreq, TOP_REACTIONS_GIVEN);

    m.topWords    = toCountEntries(acc.wordFreq, TOP_WORDS);
    m.topPhrases  = toCountEntries(acc.phraseFreq, TOP_PHRASES);
    m.uniqueWords = static_cast<long long>(acc.wordFreq.size());
    m.vocabularyRichness = acc.totalWords > 0
        ? static_cast<double>(acc.wordFreq.size()) / static_cast<double>(acc.totalWords)
        : 0.0;

    m.questionsAskedPer1k = per1k(acc.questionsAsked, acc.totalMessages);
    m.mediaSharedPer1k    = per1k(acc.mediaShared, acc.totalMessages);
    m.linksSharedPer1k    = per1k(acc.linksShared, acc.totalMessages);
    m.emojiRatePer1k      = per1k(acc.messagesWithEmoji, acc.totalMessages);

    m.mentionsMade     = acc.mentionsMade;
    m.mentionsReceived = acc.mentionsReceived;
    m.repliesSent      = acc.repliesSent;
    m.repliesReceived  = acc.repliesReceived;
    return m;
}

ResponseTimeStats buildResponseTimeStats(const PersonAccumulator& acc)
{
    ResponseTimeStats s;
    const std::vector<double>& rts = acc.responseTimes;

    s.sampleSize = static_cast<long long>(rts.size());
    if (!rts.empty())
    {
        std::vector<double> sorted = rts;
        std::sort(sorted.begin(), sorted.end());

        s.averageResponseTimeMs = mean(rts);
        s.medianResponseTimeMs  = median(rts);
        s.fastestResponseMs     = sorted.front();
        s.slowestResponseMs     = sorted.back();

        s.trimmedMeanMs = trimmedMean(rts, TRIMMED_MEAN_FRACTION);
        s.stdDevMs      = populationStdDev(rts);
        s.q1Ms  = percentileSorted(sorted, 25.0);
        s.q3Ms  = percentileSorted(sorted, 75.0);
        s.iqrMs = s.q3Ms - s.q1Ms;
        s.p75Ms = s.q3Ms;
        s.p90Ms = percentileSorted(sorted, 90.0);
        s.p95Ms = percentileSorted(sorted, 95.0);
        s.skewness = skewness(rts);
    }

    // Trend over monthly averages, chronological since the map is keyed YYYY-MM.
    std::vector<double> monthlyAvgs;
    for (const auto& kv : acc.monthlyResponseTimes)
        monthlyAvgs.push_back(mean(kv.second));
    s.responseTimeTrend = linearRegressionSlope(monthlyAvgs);

    return s;
}

TimingMetrics buildTimingMetrics(const ConversationAccumulators& accs)
{
    TimingMetrics t;
    for (const PersonAccumulator& acc : accs.people)
    {
        t.perPerson[acc.name]               = buildResponseTimeStats(acc);
        t.conversationInitiations[acc.name] = acc.initiations;
        t.conversationEndings[acc.name]     = acc.endings;
        t.lateNightMessages[acc.name]       = acc.lateNightMessages;
    }
    t.longestSilence = accs.longestSilence;
    return t;
}

EngagementMetrics buildEngagementMetrics(const ConversationAccumulators& accs, Platform platform)
{
    EngagementMetrics e;
    const double total = static_cast<double>(accs.totalMessages);

    for (const PersonAccumulator& acc : accs.people)
    {
        const double own = static_cast<double>(acc.totalMessages);

        e.doubleTexts[acc.name]    = acc.doubleTexts;
        e.maxConsecutive[acc.name] = acc.maxConsecutive;
        e.messageRatio[acc.name]   = safeDivide(own, total);

        double giveRate = safeDivide(static_cast<double>(acc.reactionsGiven),
                                     static_cast<double>(acc.messagesReceived));
        e.reactionRate[acc.name]        = giveRate;
        e.reactionGiveRate[acc.name]    = giveRate;
        e.reactionReceiveRate[acc.name] = safeDivide(static_cast<double>(acc.reactionsReceived), own);

        e.mentionRate[acc.name] = safeDivide(static_cast<double>(acc.mentionsMade), own);
        e.replyRate[acc.name]   = safeDivide(static_cast<double>(acc.repliesSent), own);
    }

    e.hasMentionReplyRates  = platform == Platform::Discord;
    e.totalSessions         = accs.totalSessions;
    e.avgConversationLength = accs.totalSessions > 0
        ? total / static_cast<double>(accs.totalSessions)
        : total;
    return e;
}

PatternMetrics buildPatternMetrics(const ConversationAccumulators& accs)
{
    PatternMetrics p;

    std::vector<double> monthlyTotals;
    for (const auto& kv : accs.monthlyVolume)
    {
        MonthlyVolumePoint point;
        point.month     = kv.first;
        point.perPerson = kv.second;
        for (const auto& pc : kv.second)
            point.total += pc.second;
        monthlyTotals.push_back(static_cast<double>(point.total));
        p.monthlyVolume.push_back(std::move(point));
    }
    p.volumeTrend = linearRegressionSlope(monthlyTotals);

    for (const PersonAccumulator& acc : accs.people)
    {
        p.weekdayMessages[acc.name] = acc.weekdayMessages;
        p.weekendMessages[acc.name] = acc.weekendMessages;
    }

    p.bursts = detectBursts(accs.dailyCounts);
    return p;
}

HeatmapData buildHeatmapData(const ConversationAccumulators& accs)
{
    HeatmapData h;
    for (const PersonAccumulator& acc : accs.people)
        h.perPerson[acc.name] = acc.heatmap;
    h.combined = accs.combinedHeatmap;
    return h;
}

// Values of one person across the series, optionally skipping zero months.
static std::vector<double> personSeries(const std::vector<MonthlySeriesPoint>& series,
                                        const std::string& name,
                                        bool skipEmptyMonths)
{
    std::vector<double> values;
    for (const MonthlySeriesPoint& point : series)
    {
        auto it = point.perPerson.find(name);
        double v = it == point.perPerson.end() ? 0.0 : it->second;
        if (skipEmptyMonths && v <= 0.0)
            continue;
        values.push_back(v);
    }
    return values;
}

TrendData buildTrendData(const ConversationAccumulators& accs)
{
    TrendData trends;

    for (const auto& monthEntry : accs.monthlyVolume)
    {
        const std::string& month = monthEntry.first;

        MonthlySeriesPoint rt;
        MonthlySeriesPoint len;
        rt.month  = month;
        len.month = month;

        for (const PersonAccumulator& acc : accs.people)
        {
            auto rtIt = acc.monthlyResponseTimes.find(month);
            rt.perPerson[acc.name] = (rtIt != acc.monthlyResponseTimes.end())
                ? mean(rtIt->second)
                : 0.0;

            double avgWords = 0.0;
            auto lenIt = acc.monthlyWordCounts.find(month);
            if (lenIt != acc.monthlyWordCounts.end() && !lenIt->second.empty())
            {
                long long sum = 0;
                for (long long w : lenIt->second) sum += w;
                avgWords = static_cast<double>(sum) / static_cast<double>(lenIt->second.size());
            }
            len.perPerson[acc.name] = avgWords;
        }

        MonthlySeriesPoint init;
        init.month = month;
        for (const std::string& name : accs.declaredNames)
            init.perPerson[name] = 0.0;
        auto initIt = accs.monthlyInitiations.find(month);
        if (initIt != accs.monthlyInitiations.end())
        {
            for (const auto& kv : initIt->second)
                init.perPerson[kv.first] = static_cast<double>(kv.second);
        }

        trends.responseTimeTrend.push_back(std::move(rt));
        trends.messageLengthTrend.push_back(std::move(len));
        trends.initiationTrend.push_back(std::move(init));
    }

    for (const PersonAccumulator& acc : accs.people)
    {
        trends.responseTimeSlope[acc.name] =
            linearRegressionSlope(personSeries(trends.responseTimeTrend, acc.name, true));
        trends.messageLengthSlope[acc.name] =
            linearRegressionSlope(personSeries(trends.messageLengthTrend, acc.name, true));
        trends.initiationSlope[acc.name] =
            linearRegressionSlope(personSeries(trends.initiationTrend, acc.name, false));
    }

    return trends;
}
