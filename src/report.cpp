#include "report.hpp"
#include "analysis_constants.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

// -------------------------------------------------------------
// Helpers
// -------------------------------------------------------------
std::string formatWithCommas(long long value) {
    bool negative = value < 0;
    unsigned long long v = negative ? 0ULL - static_cast<unsigned long long>(value)
                                    : static_cast<unsigned long long>(value);
    std::string s = std::to_string(v);
    int insertPos = static_cast<int>(s.size()) - 3;
    while (insertPos > 0) {
        s.insert(static_cast<std::string::size_type>(insertPos), ",");
        insertPos -= 3;
    }
    if (negative) s.insert(s.begin(), '-');
    return s;
}

static std::string PadNumberSuffix(const std::string& number,
                                   const std::string& suffix,
                                   int numberWidth)
{
    std::ostringstream oss;
    oss << std::right << std::setw(numberWidth) << number;
    if (!suffix.empty())
        oss << " " << suffix;
    return oss.str();
}

static std::string FormatFixed(double v, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

std::string formatResponseTime(double ms) {
    double seconds = ms / 1000.0;
    double minutes = seconds / 60.0;
    std::ostringstream tmp;
    tmp << std::fixed << std::setprecision(2)
        << minutes << " min ("
        << seconds << " s)";
    return tmp.str();
}

std::string formatDuration(long long ms) {
    if (ms < 0) ms = 0;
    long long days    = ms / DAY_MS;
    long long hours   = (ms % DAY_MS) / HOUR_MS;
    long long minutes = (ms % HOUR_MS) / 60000LL;

    std::ostringstream tmp;
    if (days > 0)
        tmp << days << " d ";
    if (days > 0 || hours > 0)
        tmp << hours << " h ";
    tmp << minutes << " min";
    return tmp.str();
}

std::string abbreviateContent(const std::string& input, std::size_t maxLen) {
    std::string s = input;
    for (char& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    if (s.size() <= maxLen) return s;
    if (maxLen <= 3) return std::string(maxLen, '.');
    // don't cut a UTF-8 sequence in half
    std::size_t cut = maxLen - 3;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
        --cut;
    return s.substr(0, cut) + "...";
}

template <typename T>
static T valueFor(const std::map<std::string, T>& m, const std::string& key)
{
    auto it = m.find(key);
    return it == m.end() ? T() : it->second;
}

// -------------------------------------------------------------
// Report
// -------------------------------------------------------------
std::string renderTextReport(const Conversation& conversation, const QuantitativeAnalysis& q)
{
    std::ostringstream out;

    const int LABEL_WIDTH = 40;
    const int COL_WIDTH   = 26;
    const int NUM_WIDTH   = 12;

    const std::vector<std::string>& userNames = q.participants;

    // Helper: comparative row
    auto printRow = [&](const std::string& label,
                        const std::vector<std::string>& values) {
        out << " " << std::left << std::setw(LABEL_WIDTH) << (label + ":");
        for (const auto& v : values)
            out << " " << std::right << std::setw(COL_WIDTH) << v;
        out << "\n";
    };

    // Helper: single stat
    auto printSingle = [&](const std::string& label,
                           const std::string& value) {
        out << " " << std::left << std::setw(LABEL_WIDTH)
            << (label + ":") << " " << value << "\n";
    };

    auto printHeader = [&]() {
        out << " " << std::left << std::setw(LABEL_WIDTH) << "";
        for (const auto& name : userNames)
            out << " " << std::left << std::setw(COL_WIDTH) << abbreviateContent(name, COL_WIDTH);
        out << "\n";
    };

    // Count row with a unit suffix.
    auto countRow = [&](const std::string& label,
                        const std::map<std::string, long long>& values,
                        const std::string& suffix) {
        std::vector<std::string> vals;
        for (const auto& name : userNames)
            vals.push_back(PadNumberSuffix(formatWithCommas(valueFor(values, name)), suffix, NUM_WIDTH));
        printRow(label, vals);
    };

    out << "=== Chat Metrics";
    if (!conversation.title.empty())
        out << ": " << conversation.title;
    out << " ===\n";
    out << "Platform: " << platformToString(conversation.platform)
        << (conversation.isGroup ? " (group)" : "") << "\n\n";

    if (userNames.empty()) {
        out << "No messages found.\n";
        return out.str();
    }

    std::map<std::string, long long> totals;
    std::map<std::string, long long> questions;
    std::map<std::string, long long> media;
    std::map<std::string, long long> given;
    std::map<std::string, long long> received;
    for (const auto& kv : q.perPerson) {
        totals[kv.first]    = kv.second.totalMessages;
        questions[kv.first] = kv.second.questionsAsked;
        media[kv.first]     = kv.second.mediaShared;
        given[kv.first]     = kv.second.reactionsGiven;
        received[kv.first]  = kv.second.reactionsReceived;
    }

    // -----------------------------------------------------
    // General comparative section
    // -----------------------------------------------------
    out << "[General Message Data & Conversation Dynamics]\n";
    printHeader();

    countRow("Total messages", totals, "messages");

    {
        std::vector<std::string> vals;
        for (const auto& name : userNames) {
            const PersonMetrics pm = valueFor(q.perPerson, name);
            vals.push_back(PadNumberSuffix(FormatFixed(pm.averageMessageLength, 2), "words", NUM_WIDTH));
        }
        printRow("Average message length", vals);
    }

    countRow("Conversations started", q.timing.conversationInitiations, "conversations");
    countRow("Conversations ended", q.timing.conversationEndings, "conversations");

    {
        std::vector<std::string> avgVals;
        std::vector<std::string> medVals;
        for (const auto& name : userNames) {
            auto it = q.timing.perPerson.find(name);
            if (it != q.timing.perPerson.end() && it->second.sampleSize > 0) {
                avgVals.push_back(formatResponseTime(it->second.averageResponseTimeMs));
                medVals.push_back(formatResponseTime(it->second.medianResponseTimeMs));
            } else {
                avgVals.push_back("N/A");
                medVals.push_back("N/A");
            }
        }
        printRow("Average response time", avgVals);
        printRow("Median response time", medVals);
    }

    countRow("Double-text runs (>=2 in a row)", q.engagement.doubleTexts, "occurrences");
    countRow("Longest run", q.engagement.maxConsecutive, "messages");
    countRow("Late-night messages (22-04)", q.timing.lateNightMessages, "messages");
    countRow("Questions asked", questions, "messages");
    countRow("Media shared", media, "messages");

    out << "\n";

    // -----------------------------------------------------
    // Reactions comparative section
    // -----------------------------------------------------
    out << "[Reactions]\n";
    printHeader();
    countRow("Reactions sent", given, "reactions");
    countRow("Reactions received", received, "reactions");
    {
        std::vector<std::string> vals;
        for (const auto& name : userNames)
            vals.push_back(FormatFixed(valueFor(q.engagement.reactionRate, name), 3));
        printRow("Reactions per message received", vals);
    }
    out << "\n";

    // -----------------------------------------------------
    // Timing
    // -----------------------------------------------------
    out << "[Timing]\n";
    printSingle("Sessions", formatWithCommas(q.engagement.totalSessions));
    printSingle("Messages per session", FormatFixed(q.engagement.avgConversationLength, 2));
    {
        const LongestSilence& s = q.timing.longestSilence;
        if (s.durationMs > 0) {
            printSingle("Longest silence",
                        formatDuration(s.durationMs) + " (" + s.lastSender + " -> " + s.nextSender + ")");
        } else {
            printSingle("Longest silence", "N/A");
        }
    }
    for (const auto& kv : q.bestTimeToText)
        printSingle("Best time to text " + kv.first, kv.second.bestWindow);
    out << "\n";

    // -----------------------------------------------------
    // Patterns
    // -----------------------------------------------------
    out << "[Activity Patterns]\n";
    printSingle("Active months", formatWithCommas(static_cast<long long>(q.patterns.monthlyVolume.size())));
    printSingle("Monthly volume trend", FormatFixed(q.patterns.volumeTrend, 2) + " messages/month");
    if (q.patterns.bursts.empty()) {
        printSingle("Bursts", "(none)");
    } else {
        for (const BurstPeriod& b : q.patterns.bursts) {
            std::ostringstream tmp;
            tmp << b.startDate << " .. " << b.endDate << " | "
                << formatWithCommas(b.messageCount) << " messages, "
                << FormatFixed(b.avgDaily, 1) << "/day";
            printSingle("Burst", tmp.str());
        }
    }
    out << "\n";

    // -----------------------------------------------------
    // Scores
    // -----------------------------------------------------
    out << "[Scores]\n";
    printSingle("Reciprocity", FormatFixed(q.reciprocityIndex.overall, 0) + " / 100");
    printSingle("Compatibility", FormatFixed(q.viralScores.compatibility.score, 0) + " / 100");
    printHeader();
    {
        std::vector<std::string> interest;
        std::vector<std::string> ghost;
        for (const auto& name : userNames) {
            auto it = q.viralScores.interestScores.find(name);
            interest.push_back(it == q.viralScores.interestScores.end() ? "N/A" : FormatFixed(it->second, 0));
            auto gr = q.viralScores.ghostRisk.find(name);
            ghost.push_back(gr == q.viralScores.ghostRisk.end() ? "N/A" : FormatFixed(gr->second.score, 0));
        }
        printRow("Interest", interest);
        printRow("Ghost risk", ghost);
    }
    {
        std::string delusion = FormatFixed(q.viralScores.delusionScore, 0);
        if (q.viralScores.delusionHolder)
            delusion += " (" + *q.viralScores.delusionHolder + ")";
        printSingle("Delusion gap", delusion);
    }
    out << "\n";

    if (q.networkMetrics) {
        out << "[Group Network]\n";
        printSingle("Density", FormatFixed(q.networkMetrics->density, 3));
        printSingle("Most connected", q.networkMetrics->mostConnected);
        for (const NetworkEdge& e : q.networkMetrics->edges) {
            std::ostringstream tmp;
            tmp << formatWithCommas(e.weight) << " (" << formatWithCommas(e.fromToCount)
                << " / " << formatWithCommas(e.toFromCount) << ")";
            printSingle(e.from + " <-> " + e.to, tmp.str());
        }
        out << "\n";
    }

    // -----------------------------------------------------
    // Word usage & longest messages (per user), last section
    // -----------------------------------------------------
    out << "[Word Usage & Longest Messages]\n";
    for (const auto& name : userNames) {
        const PersonMetrics stats = valueFor(q.perPerson, name);

        out << "User: " << name << "\n";

        if (stats.longestMessage.wordCount > 0) {
            std::ostringstream tmp;
            tmp << formatWithCommas(stats.longestMessage.wordCount) << " words"
                << " | Preview: "
                << abbreviateContent(stats.longestMessage.content, 80);
            printSingle("Longest message", tmp.str());
        } else {
            printSingle("Longest message", "(no textual messages)");
        }

        if (!stats.topWords.empty()) {
            std::ostringstream tmp;
            int printed = 0;
            for (const CountEntry& w : stats.topWords) {
                if (printed > 0) tmp << ", ";
                tmp << w.key << ": " << formatWithCommas(w.count);
                if (++printed >= 10)
                    break;
            }
            printSingle("Top 10 most used words", tmp.str());
        } else {
            printSingle("Top 10 most used words", "(no words recorded)");
        }

        auto cp = q.catchphrases.find(name);
        if (cp != q.catchphrases.end() && !cp->second.empty()) {
            std::ostringstream tmp;
            for (std::size_t i = 0; i < cp->second.size(); ++i) {
                if (i > 0) tmp << ", ";
                tmp << "\"" << cp->second[i].phrase << "\" x" << cp->second[i].count;
            }
            printSingle("Catchphrases", tmp.str());
        }

        out << "\n";
    }

    return out.str();
}
