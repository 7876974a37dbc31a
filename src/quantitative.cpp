#include "quantitative.hpp"
#include "accumulator.hpp"
#include "analysis_constants.hpp"
#include "best_time.hpp"
#include "catchphrases.hpp"
#include "derived_metrics.hpp"
#include "network.hpp"
#include "reciprocity.hpp"
#include "viral_scores.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

static void validateParticipants(const Conversation& conversation)
{
    std::unordered_set<std::string> seen;
    for (const Participant& p : conversation.participants)
    {
        if (p.name.empty())
            throw std::invalid_argument("participant with an empty name");
        if (!seen.insert(p.name).second)
            throw std::invalid_argument("participant declared twice: " + p.name);
    }
}

static void validateTimestamps(const Conversation& conversation)
{
    const std::vector<Message>& messages = conversation.messages;
    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        const long long ts = messages[i].timestampMs;
        if (ts < -MAX_TIMESTAMP_MS || ts > MAX_TIMESTAMP_MS)
            throw std::invalid_argument("message " + std::to_string(i) + ": timestamp out of range");
    }
}

QuantitativeAnalysis computeQuantitativeAnalysis(const Conversation& conversation)
{
    validateParticipants(conversation);
    validateTimestamps(conversation);

    const ConversationAccumulators accs = accumulateConversation(conversation);
    const std::vector<std::string>& names = accs.declaredNames;

    QuantitativeAnalysis q;
    for (const PersonAccumulator& acc : accs.people)
    {
        q.participants.push_back(acc.name);
        q.perPerson[acc.name] = buildPersonMetrics(acc);
    }

    q.timing     = buildTimingMetrics(accs);
    q.engagement = buildEngagementMetrics(accs, conversation.platform);
    q.patterns   = buildPatternMetrics(accs);
    q.heatmap    = buildHeatmapData(accs);
    q.trends     = buildTrendData(accs);

    q.reciprocityIndex = computeReciprocityIndex(q.engagement, q.timing, q.perPerson, names);

    if (conversation.isGroup)
        q.networkMetrics = computeNetworkMetrics(conversation, names);

    q.viralScores = computeViralScores(q, names, accs.totalMessages);

    q.bestTimeToText = computeBestTimeToText(q.heatmap, q.timing, names);
    q.catchphrases   = computeCatchphrases(accs, names);

    return q;
}
