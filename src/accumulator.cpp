#include "accumulator.hpp"
#include "calendar.hpp"
#include "text_features.hpp"

#include <utility>

PersonAccumulator& ConversationAccumulators::personFor(const std::string& name)
{
    auto it = index.find(name);
    if (it != index.end())
        return people[it->second];

    index.emplace(name, people.size());
    people.emplace_back();
    people.back().name = name;
    return people.back();
}

const PersonAccumulator* ConversationAccumulators::find(const std::string& name) const
{
    auto it = index.find(name);
    return it == index.end() ? nullptr : &people[it->second];
}

// Month bucket pre-filled with zeros for every declared participant.
static std::map<std::string, long long>& monthBucket(
    std::map<std::string, std::map<std::string, long long>>& byMonth,
    const std::string& month,
    const std::vector<std::string>& declaredNames)
{
    auto it = byMonth.find(month);
    if (it == byMonth.end())
    {
        std::map<std::string, long long> init;
        for (const std::string& name : declaredNames)
            init[name] = 0;
        it = byMonth.emplace(month, std::move(init)).first;
    }
    return it->second;
}

// Closes the consecutive run of `sender`: one double text per run of 2+.
static void finalizeRun(PersonAccumulator& sender, long long runLength)
{
    if (runLength >= 2)
        sender.doubleTexts++;
    if (runLength > sender.maxConsecutive)
        sender.maxConsecutive = runLength;
}

// Text-derived counters of one message for its sender.
static void accumulateContent(PersonAccumulator& acc, const Message& msg, long long wordCount)
{
    const std::string& content = msg.content;

    acc.totalWords      += wordCount;
    acc.totalCharacters += static_cast<long long>(codepointLength(content));

    const bool hasText = !isBlank(content);

    // Longest / shortest only consider non-empty content.
    if (hasText)
    {
        if (wordCount > acc.longestMessage.wordCount)
        {
            acc.longestMessage.content     = content;
            acc.longestMessage.wordCount   = wordCount;
            acc.longestMessage.timestampMs = msg.timestampMs;
        }
        if (wordCount > 0 &&
            (!acc.hasShortestMessage || wordCount < acc.shortestMessage.wordCount))
        {
            acc.shortestMessage.content     = content;
            acc.shortestMessage.wordCount   = wordCount;
            acc.shortestMessage.timestampMs = msg.timestampMs;
            acc.hasShortestMessage          = true;
        }
    }

    std::vector<std::string> emojis = extractEmojis(content);
    if (!emojis.empty())
    {
        acc.messagesWithEmoji++;
        acc.emojiCount += static_cast<long long>(emojis.size());
        for (const std::string& e : emojis)
            acc.emojiFreq.add(e);
    }

    if (containsQuestion(content))
        acc.questionsAsked++;

    if (hasText)
    {
        std::vector<std::string> tokens = tokenizeWords(content);
        for (const std::string& w : tokens)
            acc.wordFreq.add(w);
        for (const std::string& b : adjacentBigrams(tokens))
            acc.phraseFreq.add(b);
        for (const std::string& t : adjacentTrigrams(tokens))
            acc.trigramFreq.add(t);
    }

    if (msg.hasMedia) acc.mediaShared++;
    if (msg.hasLink)  acc.linksShared++;
    if (msg.isUnsent) acc.unsentMessages++;
}

ConversationAccumulators accumulateConversation(const Conversation& conversation)
{
    ConversationAccumulators accs;

    for (const Participant& p : conversation.participants)
    {
        accs.declaredNames.push_back(p.name);
        accs.personFor(p.name);
    }

    const std::vector<Message>& messages = conversation.messages;
    const long long sessionGap = sessionGapMs(conversation.platform);

    std::string runSender;
    long long   runLength = 0;
    PersonAccumulator* runAcc = nullptr;

    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        const Message& msg = messages[i];
        const Message* prev = i > 0 ? &messages[i - 1] : nullptr;
        const long long gap = prev ? msg.timestampMs - prev->timestampMs : 0;

        PersonAccumulator& acc = accs.personFor(msg.sender);
        const CalendarSlot slot = calendarSlotFor(msg.timestampMs);
        const std::string month = monthKey(slot);

        accs.totalMessages++;
        acc.totalMessages++;

        const long long wordCount = countWords(msg.content);
        accumulateContent(acc, msg, wordCount);

        // Reactions: actors gave, the sender received.
        for (const Reaction& r : msg.reactions)
        {
            acc.reactionsReceived++;

            PersonAccumulator& actor = accs.personFor(r.actor);
            actor.reactionsGiven++;
            actor.reactionsGivenFreq.add(r.emoji);
        }

        // Mentions / replies (Discord)
        for (const std::string& mentioned : msg.mentions)
        {
            acc.mentionsMade++;
            auto it = accs.index.find(mentioned);
            if (it != accs.index.end() && mentioned != msg.sender)
                accs.people[it->second].mentionsReceived++;
        }
        if (msg.replyToIndex >= 0)
        {
            acc.repliesSent++;
            if (static_cast<std::size_t>(msg.replyToIndex) < messages.size())
            {
                const std::string& target = messages[static_cast<std::size_t>(msg.replyToIndex)].sender;
                if (target != msg.sender)
                    accs.personFor(target).repliesReceived++;
            }
        }

        // Every message is "received" by everybody else known so far.
        for (PersonAccumulator& other : accs.people)
        {
            if (other.name != msg.sender)
                other.messagesReceived++;
        }

        // Sessions
        if (i == 0)
        {
            accs.totalSessions = 1;
            acc.initiations++;
            monthBucket(accs.monthlyInitiations, month, accs.declaredNames)[msg.sender]++;
        }
        else if (gap >= sessionGap)
        {
            accs.totalSessions++;
            accs.personFor(prev->sender).endings++;
            acc.initiations++;
            monthBucket(accs.monthlyInitiations, month, accs.declaredNames)[msg.sender]++;
        }

        // Longest silence, first occurrence wins ties.
        if (prev && gap > accs.longestSilence.durationMs)
        {
            accs.longestSilence.durationMs       = gap;
            accs.longestSilence.startTimestampMs = prev->timestampMs;
            accs.longestSilence.endTimestampMs   = msg.timestampMs;
            accs.longestSilence.lastSender       = prev->sender;
            accs.longestSilence.nextSender       = msg.sender;
        }

        // Response time: a reply within the same session.
        if (prev && prev->sender != msg.sender && gap < sessionGap)
        {
            acc.responseTimes.push_back(static_cast<double>(gap));
            acc.monthlyResponseTimes[month].push_back(static_cast<double>(gap));
        }

        if (isLateNight(slot))
            acc.lateNightMessages++;

        // Consecutive runs
        if (runAcc != nullptr && msg.sender == runSender)
        {
            runLength++;
        }
        else
        {
            if (runAcc != nullptr)
                finalizeRun(*runAcc, runLength);
            runSender = msg.sender;
            runAcc    = &acc;
            runLength = 1;
        }

        // Heatmap
        acc.heatmap[slot.weekday][slot.hour]++;
        accs.combinedHeatmap[slot.weekday][slot.hour]++;

        monthBucket(accs.monthlyVolume, month, accs.declaredNames)[msg.sender]++;

        if (isWeekend(slot))
            acc.weekendMessages++;
        else
            acc.weekdayMessages++;

        accs.dailyCounts[dayKey(slot)]++;

        acc.monthlyWordCounts[month].push_back(wordCount);
    }

    if (runAcc != nullptr)
        finalizeRun(*runAcc, runLength);

    // The last message always closes a session.
    if (!messages.empty())
        accs.personFor(messages.back().sender).endings++;

    return accs;
}
