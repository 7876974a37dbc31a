#include "catchphrases.hpp"
#include "analysis_constants.hpp"
#include "stats_math.hpp"

#include <algorithm>
#include <unordered_map>

static void addCandidates(const FrequencyCounter& freq,
                          const std::unordered_map<std::string, long long>& globalCounts,
                          std::vector<CatchphraseEntry>& out)
{
    for (const auto& kv : freq.entries())
    {
        if (kv.second < CATCHPHRASE_MIN_COUNT)
            continue;

        auto it = globalCounts.find(kv.first);
        const long long global = it == globalCounts.end() ? kv.second : it->second;
        const double uniqueness = safeDivide(static_cast<double>(kv.second), static_cast<double>(global));
        if (uniqueness < CATCHPHRASE_MIN_UNIQUENESS)
            continue;

        CatchphraseEntry entry;
        entry.phrase     = kv.first;
        entry.count      = kv.second;
        entry.uniqueness = roundHalfUp(uniqueness * 100.0) / 100.0;
        out.push_back(entry);
    }
}

std::map<std::string, std::vector<CatchphraseEntry>> computeCatchphrases(
    const ConversationAccumulators& accs,
    const std::vector<std::string>& names)
{
    std::map<std::string, std::vector<CatchphraseEntry>> result;

    std::unordered_map<std::string, long long> globalCounts;
    for (const std::string& name : names)
    {
        const PersonAccumulator* acc = accs.find(name);
        if (acc == nullptr)
            continue;
        for (const auto& kv : acc->phraseFreq.entries())
            globalCounts[kv.first] += kv.second;
        for (const auto& kv : acc->trigramFreq.entries())
            globalCounts[kv.first] += kv.second;
    }

    for (const std::string& name : names)
    {
        std::vector<CatchphraseEntry>& candidates = result[name];
        const PersonAccumulator* acc = accs.find(name);
        if (acc == nullptr)
            continue;

        addCandidates(acc->phraseFreq, globalCounts, candidates);
        addCandidates(acc->trigramFreq, globalCounts, candidates);

        std::stable_sort(
            candidates.begin(), candidates.end(),
            [](const CatchphraseEntry& a, const CatchphraseEntry& b) {
                return static_cast<double>(a.count) * a.uniqueness >
                       static_cast<double>(b.count) * b.uniqueness;
            }
        );
        if (candidates.size() > CATCHPHRASE_MAX_PER_PERSON)
            candidates.resize(CATCHPHRASE_MAX_PER_PERSON);
    }

    return result;
}
