#include <gtest/gtest.h>

#include "accumulator.hpp"
#include "derived_metrics.hpp"
#include "test_support.hpp"

// ============================================================================
// Runs and sessions
// ============================================================================

TEST(AccumulationTest, DoubleTextCountedOncePerRun) {
    Conversation c = makeConversation({"A", "B"});
    const char* senders[] = {"A", "A", "A", "B", "A", "A"};
    for (int i = 0; i < 6; ++i)
        c.messages.push_back(makeMessage(senders[i], T0 + i * MINUTE_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    const PersonAccumulator* a = accs.find("A");
    const PersonAccumulator* b = accs.find("B");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    EXPECT_EQ(a->doubleTexts, 2);
    EXPECT_EQ(a->maxConsecutive, 3);
    EXPECT_EQ(b->doubleTexts, 0);
    EXPECT_EQ(b->maxConsecutive, 1);
}

TEST(AccumulationTest, SessionGapStartsNewSession) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("A", T0));
    c.messages.push_back(makeMessage("B", T0 + MINUTE_MS));
    c.messages.push_back(makeMessage("A", T0 + 7 * HOUR_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    EXPECT_EQ(accs.totalSessions, 2);

    const PersonAccumulator* a = accs.find("A");
    const PersonAccumulator* b = accs.find("B");
    EXPECT_EQ(a->initiations, 2);
    EXPECT_EQ(b->initiations, 0);
    EXPECT_EQ(b->endings, 1);
    EXPECT_EQ(a->endings, 1);

    // Only B answered inside a session.
    ASSERT_EQ(b->responseTimes.size(), 1u);
    EXPECT_DOUBLE_EQ(b->responseTimes[0], static_cast<double>(MINUTE_MS));
    EXPECT_TRUE(a->responseTimes.empty());
}

TEST(AccumulationTest, DiscordUsesShorterSessionGap) {
    Conversation messenger = makeConversation({"A", "B"});
    messenger.messages.push_back(makeMessage("A", T0));
    messenger.messages.push_back(makeMessage("B", T0 + 3 * HOUR_MS));

    Conversation discord = messenger;
    discord.platform = Platform::Discord;

    EXPECT_EQ(accumulateConversation(messenger).totalSessions, 1);
    EXPECT_EQ(accumulateConversation(discord).totalSessions, 2);
}

TEST(AccumulationTest, LongestSilenceKeepsFirstOfEqualGaps) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("A", T0));
    c.messages.push_back(makeMessage("B", T0 + 5 * MINUTE_MS));
    c.messages.push_back(makeMessage("A", T0 + 15 * MINUTE_MS));
    c.messages.push_back(makeMessage("B", T0 + 25 * MINUTE_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    EXPECT_EQ(accs.longestSilence.durationMs, 10 * MINUTE_MS);
    EXPECT_EQ(accs.longestSilence.startTimestampMs, T0 + 5 * MINUTE_MS);
    EXPECT_EQ(accs.longestSilence.lastSender, "B");
    EXPECT_EQ(accs.longestSilence.nextSender, "A");
}

// ============================================================================
// Lazy participants
// ============================================================================

TEST(AccumulationTest, UnknownSenderIsAppendedAfterDeclaredNames) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("C", T0));
    c.messages.push_back(makeMessage("A", T0 + MINUTE_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    ASSERT_EQ(accs.people.size(), 3u);
    EXPECT_EQ(accs.people[0].name, "A");
    EXPECT_EQ(accs.people[1].name, "B");
    EXPECT_EQ(accs.people[2].name, "C");
    EXPECT_EQ(accs.people[2].totalMessages, 1);
    EXPECT_EQ(accs.totalMessages, 2);
}

TEST(AccumulationTest, ReactionActorWhoNeverPostsIsCreated) {
    Conversation c = makeConversation({"A", "B"});
    Message m = makeMessage("A", T0);
    m.reactions.push_back(Reaction{"\xF0\x9F\x98\x82", "D"});
    m.reactions.push_back(Reaction{"\xF0\x9F\x98\x82", "B"});
    c.messages.push_back(m);
    c.messages.push_back(makeMessage("B", T0 + MINUTE_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    const PersonAccumulator* a = accs.find("A");
    const PersonAccumulator* b = accs.find("B");
    const PersonAccumulator* d = accs.find("D");
    ASSERT_NE(d, nullptr);

    EXPECT_EQ(a->reactionsReceived, 2);
    EXPECT_EQ(d->reactionsGiven, 1);
    EXPECT_EQ(d->totalMessages, 0);
    EXPECT_EQ(b->reactionsGiven, 1);
    EXPECT_EQ(b->reactionsGivenFreq.countOf("\xF0\x9F\x98\x82"), 1);

    // A received B's message, B received A's.
    EXPECT_EQ(a->messagesReceived, 1);
    EXPECT_EQ(b->messagesReceived, 1);
}

TEST(AccumulationTest, MentionsAndRepliesAreCredited) {
    Conversation c = makeConversation({"A", "B"}, Platform::Discord);
    c.messages.push_back(makeMessage("A", T0, "anyone up"));
    Message reply = makeMessage("B", T0 + MINUTE_MS, "yep");
    reply.replyToIndex = 0;
    reply.mentions.push_back("A");
    c.messages.push_back(reply);

    ConversationAccumulators accs = accumulateConversation(c);
    const PersonAccumulator* a = accs.find("A");
    const PersonAccumulator* b = accs.find("B");

    EXPECT_EQ(b->repliesSent, 1);
    EXPECT_EQ(a->repliesReceived, 1);
    EXPECT_EQ(b->mentionsMade, 1);
    EXPECT_EQ(a->mentionsReceived, 1);
}

// ============================================================================
// Calendar buckets
// ============================================================================

TEST(AccumulationTest, HeatmapLateNightAndWeekend) {
    Conversation c = makeConversation({"A"});
    c.messages.push_back(makeMessage("A", T0));                      // Mon 00:00
    c.messages.push_back(makeMessage("A", T0 + 12 * HOUR_MS));       // Mon 12:00
    c.messages.push_back(makeMessage("A", T0 + 23 * HOUR_MS));       // Mon 23:00
    c.messages.push_back(makeMessage("A", T0 + 5 * DAY_MS + HOUR_MS)); // Sat 01:00

    ConversationAccumulators accs = accumulateConversation(c);
    const PersonAccumulator* a = accs.find("A");

    EXPECT_EQ(a->heatmap[1][0], 1);
    EXPECT_EQ(a->heatmap[1][12], 1);
    EXPECT_EQ(a->heatmap[1][23], 1);
    EXPECT_EQ(a->heatmap[6][1], 1);
    EXPECT_EQ(accs.combinedHeatmap[6][1], 1);

    EXPECT_EQ(a->lateNightMessages, 3);
    EXPECT_EQ(a->weekendMessages, 1);
    EXPECT_EQ(a->weekdayMessages, 3);

    EXPECT_EQ(accs.dailyCounts.size(), 2u);
    EXPECT_EQ(accs.dailyCounts.at("2024-01-01"), 3);
    EXPECT_EQ(accs.monthlyVolume.at("2024-01").at("A"), 4);
}

TEST(AccumulationTest, MonthlyBucketsPrefillDeclaredNames) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("A", T0));

    ConversationAccumulators accs = accumulateConversation(c);
    const auto& month = accs.monthlyVolume.at("2024-01");
    EXPECT_EQ(month.at("A"), 1);
    EXPECT_EQ(month.at("B"), 0);
    EXPECT_EQ(accs.monthlyInitiations.at("2024-01").at("B"), 0);
}

// ============================================================================
// Person metrics
// ============================================================================

TEST(PersonMetricsTest, ContentFeatures) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("A", T0, "   "));
    c.messages.push_back(makeMessage("A", T0 + MINUTE_MS, "pizza tonight?"));
    c.messages.push_back(makeMessage("A", T0 + 2 * MINUTE_MS, "pizza \xF0\x9F\x98\x80"));
    Message media = makeMessage("A", T0 + 3 * MINUTE_MS, "");
    media.hasMedia = true;
    c.messages.push_back(media);
    c.messages.push_back(makeMessage("B", T0 + 4 * MINUTE_MS, ""));

    ConversationAccumulators accs = accumulateConversation(c);
    PersonMetrics a = buildPersonMetrics(*accs.find("A"));
    PersonMetrics b = buildPersonMetrics(*accs.find("B"));

    EXPECT_EQ(a.totalMessages, 4);
    EXPECT_EQ(a.totalWords, 4);
    EXPECT_DOUBLE_EQ(a.averageMessageLength, 1.0);
    EXPECT_EQ(a.questionsAsked, 1);
    EXPECT_EQ(a.mediaShared, 1);
    EXPECT_EQ(a.messagesWithEmoji, 1);
    EXPECT_EQ(a.emojiCount, 1);
    EXPECT_DOUBLE_EQ(a.questionsAskedPer1k, 250.0);

    EXPECT_EQ(a.longestMessage.content, "pizza tonight?");
    EXPECT_EQ(a.longestMessage.wordCount, 2);
    EXPECT_EQ(a.shortestMessage.wordCount, 2); // "pizza <emoji>" is two words as well
    EXPECT_EQ(a.shortestMessage.content, "pizza tonight?");

    ASSERT_FALSE(a.topWords.empty());
    EXPECT_EQ(a.topWords[0].key, "pizza");
    EXPECT_EQ(a.topWords[0].count, 2);
    EXPECT_EQ(a.uniqueWords, 2);

    // Nothing textual from B
    EXPECT_EQ(b.shortestMessage.content, "");
    EXPECT_EQ(b.shortestMessage.wordCount, 0);
    EXPECT_EQ(b.shortestMessage.timestampMs, 0);
    EXPECT_DOUBLE_EQ(b.averageMessageLength, 0.0);
}

TEST(PersonMetricsTest, ResponseTimeStatistics) {
    Conversation c = makeConversation({"A", "B"});
    long long t = T0;
    const long long gaps[] = {1, 2, 3, 4, 10};
    c.messages.push_back(makeMessage("A", t));
    for (int i = 0; i < 5; ++i) {
        t += gaps[i] * MINUTE_MS;
        c.messages.push_back(makeMessage("B", t));
        t += MINUTE_MS;
        c.messages.push_back(makeMessage("A", t));
    }

    ConversationAccumulators accs = accumulateConversation(c);
    ResponseTimeStats b = buildResponseTimeStats(*accs.find("B"));

    EXPECT_EQ(b.sampleSize, 5);
    EXPECT_DOUBLE_EQ(b.medianResponseTimeMs, 3.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.averageResponseTimeMs, 4.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.fastestResponseMs, 1.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.slowestResponseMs, 10.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.q1Ms, 2.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.q3Ms, 4.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(b.iqrMs, 2.0 * MINUTE_MS);
    EXPECT_GT(b.skewness, 0.0);
    // single month
    EXPECT_DOUBLE_EQ(b.responseTimeTrend, 0.0);
}

TEST(EngagementMetricsTest, RatesAndSessions) {
    Conversation c = makeConversation({"A", "B"});
    Message m1 = makeMessage("A", T0);
    m1.reactions.push_back(Reaction{"x", "B"});
    c.messages.push_back(m1);
    c.messages.push_back(makeMessage("A", T0 + MINUTE_MS));
    c.messages.push_back(makeMessage("B", T0 + 2 * MINUTE_MS));
    c.messages.push_back(makeMessage("A", T0 + 10 * HOUR_MS));

    ConversationAccumulators accs = accumulateConversation(c);
    EngagementMetrics e = buildEngagementMetrics(accs, Platform::Messenger);

    EXPECT_DOUBLE_EQ(e.messageRatio.at("A"), 0.75);
    EXPECT_DOUBLE_EQ(e.messageRatio.at("B"), 0.25);
    // B gave 1 reaction over the 3 messages A sent
    EXPECT_DOUBLE_EQ(e.reactionRate.at("B"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(e.reactionGiveRate.at("B"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(e.reactionReceiveRate.at("A"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(e.reactionRate.at("A"), 0.0);
    EXPECT_FALSE(e.hasMentionReplyRates);

    EXPECT_EQ(e.doubleTexts.at("A"), 1);
    EXPECT_EQ(e.totalSessions, 2);
    EXPECT_DOUBLE_EQ(e.avgConversationLength, 2.0);
}

TEST(TrendDataTest, MonthlySeriesAndSlopes) {
    Conversation c = makeConversation({"A", "B"});
    // Jan: B answers after 1 min, Feb: 2 min, Mar: 3 min
    const long long months[] = {T0, T0 + 31 * DAY_MS, T0 + 60 * DAY_MS};
    for (int i = 0; i < 3; ++i) {
        c.messages.push_back(makeMessage("A", months[i], "one two"));
        c.messages.push_back(makeMessage("B", months[i] + (i + 1) * MINUTE_MS, "one two three"));
    }

    ConversationAccumulators accs = accumulateConversation(c);
    TrendData trends = buildTrendData(accs);
    PatternMetrics patterns = buildPatternMetrics(accs);

    ASSERT_EQ(trends.responseTimeTrend.size(), 3u);
    EXPECT_EQ(trends.responseTimeTrend[0].month, "2024-01");
    EXPECT_EQ(trends.responseTimeTrend[2].month, "2024-03");
    EXPECT_DOUBLE_EQ(trends.responseTimeTrend[1].perPerson.at("B"), 2.0 * MINUTE_MS);
    EXPECT_DOUBLE_EQ(trends.responseTimeTrend[1].perPerson.at("A"), 0.0);
    EXPECT_DOUBLE_EQ(trends.responseTimeSlope.at("B"), static_cast<double>(MINUTE_MS));
    EXPECT_DOUBLE_EQ(trends.responseTimeSlope.at("A"), 0.0);

    EXPECT_DOUBLE_EQ(trends.messageLengthTrend[0].perPerson.at("B"), 3.0);
    EXPECT_DOUBLE_EQ(trends.messageLengthSlope.at("B"), 0.0);

    EXPECT_DOUBLE_EQ(trends.initiationTrend[0].perPerson.at("A"), 1.0);
    EXPECT_DOUBLE_EQ(trends.initiationTrend[0].perPerson.at("B"), 0.0);

    ASSERT_EQ(patterns.monthlyVolume.size(), 3u);
    EXPECT_EQ(patterns.monthlyVolume[0].total, 2);
    EXPECT_DOUBLE_EQ(patterns.volumeTrend, 0.0);
}
