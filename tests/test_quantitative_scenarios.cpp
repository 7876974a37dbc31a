#include <gtest/gtest.h>

#include "json_io.hpp"
#include "quantitative.hpp"
#include "test_support.hpp"

#include <stdexcept>

// A small mixed chat: three sessions, reactions, a late-night stretch.
static Conversation mixedConversation()
{
    Conversation c = makeConversation({"A", "B"});
    long long t = T0 + 20 * HOUR_MS;
    c.messages.push_back(makeMessage("A", t, "are you coming tonight?"));
    c.messages.push_back(makeMessage("B", t += 2 * MINUTE_MS, "yes! 😀"));
    c.messages.push_back(makeMessage("B", t += MINUTE_MS, "bringing snacks"));
    c.messages.back().reactions.push_back({"❤", "A"});
    c.messages.push_back(makeMessage("A", t += 5 * MINUTE_MS, "perfect"));

    t += 3 * DAY_MS;
    c.messages.push_back(makeMessage("B", t, "that was fun"));
    c.messages.push_back(makeMessage("A", t += 30 * MINUTE_MS, "we should do it again soon"));
    c.messages.back().reactions.push_back({"👍", "B"});

    t += 40 * DAY_MS;
    c.messages.push_back(makeMessage("A", t, "long time no see"));
    c.messages.push_back(makeMessage("A", t += MINUTE_MS, "how are things"));
    c.messages.push_back(makeMessage("B", t += HOUR_MS, "busy but good"));
    return c;
}

TEST(QuantitativeScenarioTest, CountsAreConserved) {
    Conversation c = mixedConversation();
    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);
    const long long n = static_cast<long long>(c.messages.size());

    long long perPersonTotal = 0;
    for (const auto& kv : q.perPerson)
        perPersonTotal += kv.second.totalMessages;
    EXPECT_EQ(perPersonTotal, n);

    long long combined = 0;
    long long perPersonCells = 0;
    for (int day = 0; day < 7; ++day)
    {
        for (int hour = 0; hour < 24; ++hour)
        {
            combined += q.heatmap.combined[day][hour];
            for (const auto& kv : q.heatmap.perPerson)
                perPersonCells += kv.second[day][hour];
        }
    }
    EXPECT_EQ(combined, n);
    EXPECT_EQ(perPersonCells, n);

    long long monthly = 0;
    for (const MonthlyVolumePoint& p : q.patterns.monthlyVolume)
        monthly += p.total;
    EXPECT_EQ(monthly, n);

    long long initiations = 0;
    long long endings = 0;
    for (const auto& kv : q.timing.conversationInitiations)
        initiations += kv.second;
    for (const auto& kv : q.timing.conversationEndings)
        endings += kv.second;
    EXPECT_EQ(q.engagement.totalSessions, 3);
    EXPECT_EQ(initiations, 3);
    EXPECT_EQ(endings, 3);

    long long given = 0;
    long long received = 0;
    for (const auto& kv : q.perPerson)
    {
        given += kv.second.reactionsGiven;
        received += kv.second.reactionsReceived;
    }
    EXPECT_EQ(given, 2);
    EXPECT_EQ(received, 2);

    double ratios = 0.0;
    for (const auto& kv : q.engagement.messageRatio)
        ratios += kv.second;
    EXPECT_NEAR(ratios, 1.0, 1e-9);
}

TEST(QuantitativeScenarioTest, RepeatedRunsAreIdentical) {
    Conversation c = mixedConversation();
    nlohmann::json first = computeQuantitativeAnalysis(c);
    nlohmann::json second = computeQuantitativeAnalysis(c);
    EXPECT_EQ(first.dump(), second.dump());
}

TEST(QuantitativeScenarioTest, GroupWithoutMessages) {
    Conversation c = makeConversation({"A", "B", "C", "D"});
    QuantitativeAnalysis q;
    ASSERT_NO_THROW(q = computeQuantitativeAnalysis(c));

    ASSERT_EQ(q.participants.size(), 4u);
    ASSERT_EQ(q.perPerson.size(), 4u);
    for (const auto& kv : q.perPerson)
    {
        EXPECT_EQ(kv.second.totalMessages, 0);
        EXPECT_DOUBLE_EQ(kv.second.averageMessageLength, 0.0);
    }

    EXPECT_TRUE(q.patterns.monthlyVolume.empty());
    EXPECT_TRUE(q.patterns.bursts.empty());
    EXPECT_DOUBLE_EQ(q.patterns.volumeTrend, 0.0);

    EXPECT_DOUBLE_EQ(q.reciprocityIndex.overall, 50.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.messageBalance, 50.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.initiationBalance, 50.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.responseTimeSymmetry, 50.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.reactionBalance, 50.0);

    ASSERT_TRUE(q.networkMetrics.has_value());
    EXPECT_EQ(q.networkMetrics->nodes.size(), 4u);
    EXPECT_TRUE(q.networkMetrics->edges.empty());

    EXPECT_DOUBLE_EQ(q.viralScores.delusionScore, 0.0);
    EXPECT_FALSE(q.viralScores.delusionHolder.has_value());
}

TEST(QuantitativeScenarioTest, SymmetricSessionsAreBalanced) {
    Conversation c = makeConversation({"A", "B"});
    const char* first[]  = {"A", "B", "A", "B"};
    const char* second[] = {"B", "A", "B", "A"};
    for (int i = 0; i < 4; ++i)
        c.messages.push_back(makeMessage(first[i], T0 + i * MINUTE_MS));
    for (int i = 0; i < 4; ++i)
        c.messages.push_back(makeMessage(second[i], T0 + 7 * HOUR_MS + i * MINUTE_MS));

    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.messageBalance, 100.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.initiationBalance, 100.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.responseTimeSymmetry, 100.0);
    EXPECT_DOUBLE_EQ(q.viralScores.compatibility.lengthMatch, 100.0);
    EXPECT_DOUBLE_EQ(q.viralScores.compatibility.messageBalance, 100.0);
    EXPECT_EQ(q.engagement.totalSessions, 2);
}

TEST(QuantitativeScenarioTest, LongAlternatingChat) {
    Conversation c = makeConversation({"A", "B"});
    for (int i = 0; i < 1000; ++i)
        c.messages.push_back(makeMessage(i % 2 == 0 ? "A" : "B", T0 + i * MINUTE_MS,
                                         "one two three four five six seven eight nine ten"));

    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);

    EXPECT_EQ(q.perPerson["A"].totalMessages, 500);
    EXPECT_DOUBLE_EQ(q.perPerson["A"].averageMessageLength, 10.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.messageBalance, 100.0);
    EXPECT_DOUBLE_EQ(q.reciprocityIndex.responseTimeSymmetry, 100.0);
    EXPECT_DOUBLE_EQ(q.timing.perPerson["B"].medianResponseTimeMs, 60000.0);
    EXPECT_DOUBLE_EQ(q.patterns.volumeTrend, 0.0);
    EXPECT_TRUE(q.patterns.bursts.empty());
    EXPECT_EQ(q.engagement.doubleTexts["A"], 0);
    EXPECT_EQ(q.engagement.totalSessions, 1);

    EXPECT_DOUBLE_EQ(q.viralScores.ghostRisk["A"].score, 0.0);
    EXPECT_DOUBLE_EQ(q.viralScores.ghostRisk["B"].score, 0.0);

    // One session, so only A ever initiates. The 25% initiation weight alone
    // opens a 25 point interest gap (DESIGN.md, open question decision 2).
    EXPECT_DOUBLE_EQ(q.viralScores.interestScores["A"], 63.0);
    EXPECT_DOUBLE_EQ(q.viralScores.interestScores["B"], 38.0);
    EXPECT_DOUBLE_EQ(q.viralScores.delusionScore, 25.0);
    ASSERT_TRUE(q.viralScores.delusionHolder.has_value());
    EXPECT_EQ(*q.viralScores.delusionHolder, "B");
}

TEST(QuantitativeScenarioTest, MonologueThenLongSilence) {
    Conversation c = makeConversation({"A", "B"});
    for (int i = 0; i < 50; ++i)
        c.messages.push_back(makeMessage("A", T0 + i * MINUTE_MS));
    const long long lastA = T0 + 49 * MINUTE_MS;
    c.messages.push_back(makeMessage("B", lastA + 10 * DAY_MS));

    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);

    EXPECT_EQ(q.engagement.totalSessions, 2);
    EXPECT_EQ(q.timing.longestSilence.durationMs, 10 * DAY_MS);
    EXPECT_EQ(q.timing.longestSilence.startTimestampMs, lastA);
    EXPECT_EQ(q.timing.longestSilence.lastSender, "A");
    EXPECT_EQ(q.timing.longestSilence.nextSender, "B");
    EXPECT_EQ(q.engagement.doubleTexts["A"], 1);
    EXPECT_EQ(q.engagement.maxConsecutive["A"], 50);
    EXPECT_EQ(q.engagement.maxConsecutive["B"], 1);

    // A reply across a session gap is not a response.
    EXPECT_EQ(q.timing.perPerson["B"].sampleSize, 0);
}

TEST(QuantitativeScenarioTest, InvalidParticipantsAreRejected) {
    Conversation duplicate = makeConversation({"A", "B", "A"});
    EXPECT_THROW(computeQuantitativeAnalysis(duplicate), std::invalid_argument);

    Conversation unnamed = makeConversation({"A", ""});
    EXPECT_THROW(computeQuantitativeAnalysis(unnamed), std::invalid_argument);
}

TEST(QuantitativeScenarioTest, TimestampsOutOfRangeAreRejected) {
    Conversation c = makeConversation({"A", "B"});
    c.messages.push_back(makeMessage("A", -9000000000000000000LL));
    c.messages.push_back(makeMessage("B", 9000000000000000000LL));
    EXPECT_THROW(computeQuantitativeAnalysis(c), std::invalid_argument);

    c.messages[0].timestampMs = -MAX_TIMESTAMP_MS;
    c.messages[1].timestampMs = MAX_TIMESTAMP_MS;
    QuantitativeAnalysis q;
    ASSERT_NO_THROW(q = computeQuantitativeAnalysis(c));
    EXPECT_EQ(q.timing.longestSilence.durationMs, 2 * MAX_TIMESTAMP_MS);
}

TEST(QuantitativeScenarioTest, NetworkOnlyForGroups) {
    Conversation c = mixedConversation();
    EXPECT_FALSE(computeQuantitativeAnalysis(c).networkMetrics.has_value());

    c.isGroup = true;
    EXPECT_TRUE(computeQuantitativeAnalysis(c).networkMetrics.has_value());
}

TEST(QuantitativeScenarioTest, Catchphrases) {
    Conversation c = makeConversation({"A", "B"});
    long long t = T0;
    for (int i = 0; i < 4; ++i)
        c.messages.push_back(makeMessage("A", t += MINUTE_MS, "pizza tonight"));
    c.messages.push_back(makeMessage("B", t += MINUTE_MS, "pizza tonight"));
    for (int i = 0; i < 3; ++i)
        c.messages.push_back(makeMessage("B", t += MINUTE_MS, "movie night please"));

    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);

    const std::vector<CatchphraseEntry>& a = q.catchphrases["A"];
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0].phrase, "pizza tonight");
    EXPECT_EQ(a[0].count, 4);
    EXPECT_DOUBLE_EQ(a[0].uniqueness, 0.8);

    const std::vector<CatchphraseEntry>& b = q.catchphrases["B"];
    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(b[0].phrase, "movie night");
    EXPECT_EQ(b[2].phrase, "movie night please");
    EXPECT_DOUBLE_EQ(b[0].uniqueness, 1.0);
}

TEST(QuantitativeScenarioTest, BestTimeToText) {
    Conversation c = makeConversation({"A", "B"});
    const long long tuesdayNine = T0 + 45 * HOUR_MS; // Tuesday 21:00
    c.messages.push_back(makeMessage("A", T0 + 10 * HOUR_MS));
    for (int i = 0; i < 3; ++i)
        c.messages.push_back(makeMessage("A", tuesdayNine + i * MINUTE_MS));
    c.messages.push_back(makeMessage("B", tuesdayNine + 5 * MINUTE_MS));

    QuantitativeAnalysis q = computeQuantitativeAnalysis(c);

    const BestTimeToText& a = q.bestTimeToText["A"];
    EXPECT_EQ(a.bestDay, "Tuesday");
    EXPECT_EQ(a.bestHour, 21);
    EXPECT_EQ(a.bestWindow, "Tuesdays 21:00-23:00");

    const BestTimeToText& b = q.bestTimeToText["B"];
    EXPECT_EQ(b.bestWindow, "Tuesdays 21:00-23:00");
    EXPECT_DOUBLE_EQ(b.avgResponseMs, 3.0 * MINUTE_MS);
}
