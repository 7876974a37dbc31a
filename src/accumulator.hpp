#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "conversation.hpp"
#include "frequency_counter.hpp"
#include "quant_types.hpp"

// -------------------------------------------------------------
// Per-person running totals. Mutated once per message during the single
// pass, read-only afterwards.
// -------------------------------------------------------------
struct PersonAccumulator
{
    std::string name;

    long long totalMessages   = 0;
    long long totalWords      = 0;
    long long totalCharacters = 0;

    MessageRecord longestMessage;
    MessageRecord shortestMessage;
    bool          hasShortestMessage = false;

    long long        messagesWithEmoji = 0;
    long long        emojiCount        = 0;
    FrequencyCounter emojiFreq;

    long long questionsAsked = 0;
    long long mediaShared    = 0;
    long long linksShared    = 0;
    long long unsentMessages = 0;

    long long        reactionsGiven    = 0;
    long long        reactionsReceived = 0;
    FrequencyCounter reactionsGivenFreq;

    // Denominator for the reaction rate.
    long long messagesReceived = 0;

    FrequencyCounter wordFreq;
    FrequencyCounter phraseFreq;  // bigrams
    FrequencyCounter trigramFreq;

    long long mentionsMade     = 0;
    long long mentionsReceived = 0;
    long long repliesSent      = 0;
    long long repliesReceived  = 0;

    // Same-session replies to someone else, in ms.
    std::vector<double> responseTimes;
    std::map<std::string, std::vector<double>>    monthlyResponseTimes;
    std::map<std::string, std::vector<long long>> monthlyWordCounts;

    long long initiations       = 0;
    long long endings           = 0;
    long long lateNightMessages = 0;
    long long weekdayMessages   = 0;
    long long weekendMessages   = 0;

    long long doubleTexts    = 0;
    long long maxConsecutive = 0;

    HeatmapGrid heatmap{};
};

// -------------------------------------------------------------
// Everything the single pass produces. People are kept in
// declaration / first-seen order (a deque, so references stay valid when an
// unknown sender is appended); `index` maps names to slots.
// -------------------------------------------------------------
struct ConversationAccumulators
{
    std::deque<PersonAccumulator>                people;
    std::unordered_map<std::string, std::size_t> index;
    std::vector<std::string>                     declaredNames;

    long long totalMessages = 0;
    long long totalSessions = 0;

    HeatmapGrid combinedHeatmap{};

    // YYYY-MM-DD -> messages
    std::map<std::string, long long> dailyCounts;
    // YYYY-MM -> person -> messages
    std::map<std::string, std::map<std::string, long long>> monthlyVolume;
    // YYYY-MM -> person -> session initiations
    std::map<std::string, std::map<std::string, long long>> monthlyInitiations;

    LongestSilence longestSilence;

    // Returns the accumulator for `name`, creating it on first sight.
    PersonAccumulator& personFor(const std::string& name);

    const PersonAccumulator* find(const std::string& name) const;
};

// Runs the O(n) pass over conversation.messages.
ConversationAccumulators accumulateConversation(const Conversation& conversation);
