#include "reciprocity.hpp"
#include "stats_math.hpp"

#include <algorithm>
#include <cmath>

double shareBalance(double share)
{
    return clampValue(100.0 * (1.0 - 2.0 * std::fabs(share - 0.5)), 0.0, 100.0);
}

template <typename T>
static T valueOr(const std::map<std::string, T>& m, const std::string& key, T fallback)
{
    auto it = m.find(key);
    return it == m.end() ? fallback : it->second;
}

// Balance of two counts; 50 when neither side has any.
static double countBalance(long long a, long long b)
{
    const long long total = a + b;
    if (total <= 0)
        return 50.0;
    return roundHalfUp(shareBalance(static_cast<double>(a) / static_cast<double>(total)));
}

ReciprocityIndex computeReciprocityIndex(const EngagementMetrics& engagement,
                                         const TimingMetrics& timing,
                                         const std::map<std::string, PersonMetrics>& perPerson,
                                         const std::vector<std::string>& declaredNames)
{
    ReciprocityIndex r;
    if (declaredNames.size() < 2)
        return r;

    const std::string& a = declaredNames[0];
    const std::string& b = declaredNames[1];

    // Message balance: A's share of all messages. An empty conversation stays neutral.
    auto pa = perPerson.find(a);
    auto pb = perPerson.find(b);
    const long long msgsA = pa == perPerson.end() ? 0 : pa->second.totalMessages;
    const long long msgsB = pb == perPerson.end() ? 0 : pb->second.totalMessages;
    if (msgsA + msgsB > 0)
        r.messageBalance = roundHalfUp(shareBalance(valueOr(engagement.messageRatio, a, 0.5)));

    r.initiationBalance = countBalance(valueOr(timing.conversationInitiations, a, 0LL),
                                       valueOr(timing.conversationInitiations, b, 0LL));

    // Response-time symmetry on medians; one-sided data stays neutral.
    auto ta = timing.perPerson.find(a);
    auto tb = timing.perPerson.find(b);
    const double rtA = ta == timing.perPerson.end() ? 0.0 : ta->second.medianResponseTimeMs;
    const double rtB = tb == timing.perPerson.end() ? 0.0 : tb->second.medianResponseTimeMs;
    if (rtA > 0.0 && rtB > 0.0)
        r.responseTimeSymmetry = roundHalfUp(std::min(rtA, rtB) / std::max(rtA, rtB) * 100.0);

    r.reactionBalance = countBalance(pa == perPerson.end() ? 0 : pa->second.reactionsGiven,
                                     pb == perPerson.end() ? 0 : pb->second.reactionsGiven);

    r.overall = roundHalfUp((r.messageBalance + r.initiationBalance +
                             r.responseTimeSymmetry + r.reactionBalance) / 4.0);
    return r;
}
