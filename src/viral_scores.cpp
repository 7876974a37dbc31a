#include "viral_scores.hpp"
#include "analysis_constants.hpp"
#include "stats_math.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

static double lookup(const std::map<std::string, double>& m, const std::string& key)
{
    auto it = m.find(key);
    return it == m.end() ? 0.0 : it->second;
}

static long long lookup(const std::map<std::string, long long>& m, const std::string& key)
{
    auto it = m.find(key);
    return it == m.end() ? 0 : it->second;
}

static double medianOf(const TimingMetrics& timing, const std::string& name)
{
    auto it = timing.perPerson.find(name);
    return it == timing.perPerson.end() ? 0.0 : it->second.medianResponseTimeMs;
}

// min/max * 100, rounded; `neutral` when both are 0.
static double minMaxBalance(double a, double b, double neutral)
{
    const double hi = std::max(a, b);
    if (hi <= 0.0)
        return neutral;
    return roundHalfUp(std::min(a, b) / hi * 100.0);
}

// 100 - |a - b| / max * 100; 50 when both are 0.
static double closenessScore(double a, double b)
{
    const double hi = std::max(a, b);
    if (hi == 0.0)
        return 50.0;
    return clampValue(100.0 - safeDivide(std::fabs(a - b), hi) * 100.0, 0.0, 100.0);
}

// -------------------------------------------------------------
// Compatibility
// -------------------------------------------------------------

double activityOverlapScore(const HeatmapData& heatmap, const std::vector<std::string>& names)
{
    if (names.size() < 2)
        return 0.0;

    auto a = heatmap.perPerson.find(names[0]);
    auto b = heatmap.perPerson.find(names[1]);
    if (a == heatmap.perPerson.end() || b == heatmap.perPerson.end())
        return 0.0;

    std::array<double, 24> hourlyA{};
    std::array<double, 24> hourlyB{};
    double totalA = 0.0;
    double totalB = 0.0;
    for (int day = 0; day < 7; ++day)
    {
        for (int hour = 0; hour < 24; ++hour)
        {
            hourlyA[hour] += static_cast<double>(a->second[day][hour]);
            hourlyB[hour] += static_cast<double>(b->second[day][hour]);
            totalA += static_cast<double>(a->second[day][hour]);
            totalB += static_cast<double>(b->second[day][hour]);
        }
    }
    if (totalA == 0.0 || totalB == 0.0)
        return 0.0;

    double overlap = 0.0;
    for (int hour = 0; hour < 24; ++hour)
        overlap += std::min(hourlyA[hour] / totalA, hourlyB[hour] / totalB);

    return clampValue(overlap * 100.0, 0.0, 100.0);
}

double responseSymmetryScore(const TimingMetrics& timing, const std::vector<std::string>& names)
{
    if (names.size() < 2)
        return 0.0;
    return closenessScore(medianOf(timing, names[0]), medianOf(timing, names[1]));
}

double messageBalanceScore(const EngagementMetrics& engagement, const std::vector<std::string>& names)
{
    if (names.size() < 2)
        return 0.0;
    const double ratioA = lookup(engagement.messageRatio, names[0]);
    return clampValue(100.0 - std::fabs(ratioA - 0.5) * 200.0, 0.0, 100.0);
}

double engagementBalanceScore(const EngagementMetrics& engagement, const std::vector<std::string>& names)
{
    if (names.size() < 2)
        return 0.0;

    const double rateA = lookup(engagement.reactionGiveRate, names[0]);
    const double rateB = lookup(engagement.reactionGiveRate, names[1]);

    if (rateA == 0.0 && rateB == 0.0 && engagement.hasMentionReplyRates)
    {
        const double mentionBalance = minMaxBalance(lookup(engagement.mentionRate, names[0]),
                                                    lookup(engagement.mentionRate, names[1]), 50.0);
        const double replyBalance   = minMaxBalance(lookup(engagement.replyRate, names[0]),
                                                    lookup(engagement.replyRate, names[1]), 50.0);
        return roundHalfUp((mentionBalance + replyBalance) / 2.0);
    }

    return clampValue(minMaxBalance(rateA, rateB, 50.0), 0.0, 100.0);
}

double lengthMatchScore(const std::map<std::string, PersonMetrics>& perPerson,
                        const std::vector<std::string>& names)
{
    if (names.size() < 2)
        return 0.0;

    auto a = perPerson.find(names[0]);
    auto b = perPerson.find(names[1]);
    const double avgA = a == perPerson.end() ? 0.0 : a->second.averageMessageLength;
    const double avgB = b == perPerson.end() ? 0.0 : b->second.averageMessageLength;
    return closenessScore(avgA, avgB);
}

CompatibilityBreakdown computeCompatibility(const QuantitativeAnalysis& q,
                                            const std::vector<std::string>& names)
{
    CompatibilityBreakdown c;
    if (names.size() < 2)
        return c;

    c.activityOverlap   = activityOverlapScore(q.heatmap, names);
    c.responseSymmetry  = responseSymmetryScore(q.timing, names);
    c.messageBalance    = messageBalanceScore(q.engagement, names);
    c.engagementBalance = engagementBalanceScore(q.engagement, names);
    c.lengthMatch       = lengthMatchScore(q.perPerson, names);

    const double sum = c.activityOverlap + c.responseSymmetry + c.messageBalance +
                       c.engagementBalance + c.lengthMatch;
    c.score = clampValue(roundHalfUp(sum / 5.0), 0.0, 100.0);
    return c;
}

// -------------------------------------------------------------
// Interest
// -------------------------------------------------------------

double computeInterestScore(const QuantitativeAnalysis& q, const std::string& name,
                            long long conversationMessages)
{
    auto person = q.perPerson.find(name);
    if (person == q.perPerson.end() || person->second.totalMessages == 0)
        return 0.0;
    const PersonMetrics& pm = person->second;

    long long totalInitiations = 0;
    for (const auto& kv : q.timing.conversationInitiations)
        totalInitiations += kv.second;
    const double initiationScore = totalInitiations > 0
        ? clampValue(safeDivide(static_cast<double>(lookup(q.timing.conversationInitiations, name)),
                                static_cast<double>(totalInitiations)) * 100.0, 0.0, 100.0)
        : 50.0;

    // Getting faster (negative slope) scores above 50.
    const double rtSlope = lookup(q.trends.responseTimeSlope, name);
    const double rtScore = clampValue(50.0 - safeDivide(rtSlope, INTEREST_RT_SLOPE_DIVISOR), 0.0, 100.0);

    // Getting longer scores above 50.
    const double lenSlope = lookup(q.trends.messageLengthSlope, name);
    const double lenScore = clampValue(50.0 + lenSlope * INTEREST_LEN_SLOPE_FACTOR, 0.0, 100.0);

    double engagementScore = 50.0;
    const double receiveRate = lookup(q.engagement.reactionReceiveRate, name);
    if (receiveRate > 0.0)
    {
        engagementScore = clampValue(receiveRate * INTEREST_RECEIVE_RATE_FACTOR, 0.0, 100.0);
    }
    else if (q.engagement.hasMentionReplyRates)
    {
        engagementScore = clampValue(lookup(q.engagement.mentionRate, name) * INTEREST_MENTION_RATE_FACTOR +
                                     lookup(q.engagement.replyRate, name) * INTEREST_REPLY_RATE_FACTOR,
                                     0.0, 100.0);
    }

    const double doubleTexts = static_cast<double>(lookup(q.engagement.doubleTexts, name));
    const double dtPer1000 = conversationMessages > 0
        ? safeDivide(doubleTexts * 1000.0, static_cast<double>(conversationMessages))
        : 0.0;
    const double dtScore = clampValue(dtPer1000 * INTEREST_DOUBLE_TEXT_FACTOR, 0.0, 100.0);

    const double lateNight = static_cast<double>(lookup(q.timing.lateNightMessages, name));
    const double lnScore = clampValue(
        safeDivide(lateNight, static_cast<double>(pm.totalMessages)) * 1000.0, 0.0, 100.0);

    const double weighted = initiationScore * INTEREST_W_INITIATION +
                            rtScore         * INTEREST_W_RT_TREND +
                            lenScore        * INTEREST_W_LEN_TREND +
                            engagementScore * INTEREST_W_ENGAGEMENT +
                            dtScore         * INTEREST_W_DOUBLE_TEXT +
                            lnScore         * INTEREST_W_LATE_NIGHT;

    return clampValue(roundHalfUp(weighted), 0.0, 100.0);
}

// -------------------------------------------------------------
// Ghost risk
// -------------------------------------------------------------

// Range [begin, end) of a monthly series.
struct MonthRange
{
    std::size_t begin = 0;
    std::size_t end   = 0;

    std::size_t size() const { return end - begin; }
};

// Mean over the months with data; 0 months with data divides by 1.
static double activeMonthAverage(const std::vector<MonthlySeriesPoint>& series,
                                 const MonthRange& range, const std::string& name)
{
    double sum = 0.0;
    std::size_t active = 0;
    for (std::size_t i = range.begin; i < range.end; ++i)
    {
        const double v = lookup(series[i].perPerson, name);
        sum += v;
        if (v > 0.0)
            active++;
    }
    return safeDivide(sum, static_cast<double>(active > 0 ? active : 1));
}

static double monthAverage(const std::vector<MonthlySeriesPoint>& series,
                           const MonthRange& range, const std::string& name)
{
    double sum = 0.0;
    for (std::size_t i = range.begin; i < range.end; ++i)
        sum += lookup(series[i].perPerson, name);
    return safeDivide(sum, static_cast<double>(range.size()));
}

static double volumeAverage(const std::vector<MonthlyVolumePoint>& series,
                            const MonthRange& range, const std::string& name)
{
    double sum = 0.0;
    for (std::size_t i = range.begin; i < range.end; ++i)
        sum += static_cast<double>(lookup(series[i].perPerson, name));
    return safeDivide(sum, static_cast<double>(range.size()));
}

// Relative increase from `earlier` to `recent` as 0..100; improvements are 0.
static double increaseScore(double earlier, double recent)
{
    if (earlier <= 0.0 || recent <= earlier)
        return 0.0;
    return clampValue(safeDivide(recent - earlier, earlier) * 100.0, 0.0, 100.0);
}

static double decreaseScore(double earlier, double recent)
{
    if (earlier <= 0.0 || recent >= earlier)
        return 0.0;
    return clampValue(safeDivide(earlier - recent, earlier) * 100.0, 0.0, 100.0);
}

GhostRisk computeGhostRisk(const QuantitativeAnalysis& q, const std::string& name)
{
    GhostRisk risk;

    const std::size_t months = q.patterns.monthlyVolume.size();
    if (months < GHOST_RECENT_MONTHS + GHOST_MIN_EARLIER_MONTHS)
    {
        risk.factors.push_back("Insufficient data");
        return risk;
    }

    // Trend series share the monthly volume's month axis.
    const MonthRange earlier{0, months - GHOST_RECENT_MONTHS};
    const MonthRange recent{months - GHOST_RECENT_MONTHS, months};

    const std::vector<MonthlySeriesPoint>& rt  = q.trends.responseTimeTrend;
    const std::vector<MonthlySeriesPoint>& len = q.trends.messageLengthTrend;
    const std::vector<MonthlySeriesPoint>& ini = q.trends.initiationTrend;

    if (rt.size() == months)
        risk.responseTimeScore = increaseScore(activeMonthAverage(rt, earlier, name),
                                               activeMonthAverage(rt, recent, name));
    if (len.size() == months)
        risk.messageLengthScore = decreaseScore(activeMonthAverage(len, earlier, name),
                                                activeMonthAverage(len, recent, name));
    if (ini.size() == months)
        risk.initiationScore = decreaseScore(monthAverage(ini, earlier, name),
                                             monthAverage(ini, recent, name));
    risk.volumeScore = decreaseScore(volumeAverage(q.patterns.monthlyVolume, earlier, name),
                                     volumeAverage(q.patterns.monthlyVolume, recent, name));

    if (risk.responseTimeScore > GHOST_FACTOR_THRESHOLD)
        risk.factors.push_back("Response time is increasing");
    if (risk.messageLengthScore > GHOST_FACTOR_THRESHOLD)
        risk.factors.push_back("Messages are getting shorter");
    if (risk.initiationScore > GHOST_FACTOR_THRESHOLD)
        risk.factors.push_back("Initiates conversations less often");
    if (risk.volumeScore > GHOST_FACTOR_THRESHOLD)
        risk.factors.push_back("Fewer messages in recent months");

    risk.score = clampValue(roundHalfUp(risk.responseTimeScore  * GHOST_W_RESPONSE_TIME +
                                        risk.messageLengthScore * GHOST_W_MESSAGE_LENGTH +
                                        risk.initiationScore    * GHOST_W_INITIATION +
                                        risk.volumeScore        * GHOST_W_VOLUME),
                            0.0, 100.0);

    if (risk.factors.empty() && risk.score > 0.0)
        risk.factors.push_back("Minor changes in activity");

    return risk;
}

// -------------------------------------------------------------
// Delusion
// -------------------------------------------------------------

void computeDelusion(const std::map<std::string, double>& interestScores,
                     const std::vector<std::string>& names,
                     ViralScores& out)
{
    out.delusionScore = 0.0;
    out.delusionHolder.reset();

    std::vector<std::pair<std::string, double>> ranked;
    for (const std::string& name : names)
    {
        auto it = interestScores.find(name);
        if (it != interestScores.end())
            ranked.emplace_back(name, it->second);
    }
    if (ranked.size() < 2)
        return;

    std::stable_sort(
        ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) {
            return a.second > b.second;
        }
    );

    out.delusionScore = clampValue(std::fabs(ranked[0].second - ranked[1].second), 0.0, 100.0);
    if (out.delusionScore >= DELUSION_HOLDER_MIN_GAP)
        out.delusionHolder = ranked[1].first;
}

ViralScores computeViralScores(const QuantitativeAnalysis& q,
                               const std::vector<std::string>& names,
                               long long conversationMessages)
{
    ViralScores scores;
    scores.compatibility = computeCompatibility(q, names);

    for (const std::string& name : names)
    {
        scores.interestScores[name] = computeInterestScore(q, name, conversationMessages);
        scores.ghostRisk[name]      = computeGhostRisk(q, name);
    }

    computeDelusion(scores.interestScores, names, scores);
    return scores;
}
