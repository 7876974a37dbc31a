#pragma once

#include <map>
#include <string>
#include <vector>

#include "accumulator.hpp"
#include "quant_types.hpp"

// Phrases (bigrams, trigrams) one participant says noticeably more than the
// others: used at least 3 times and at least 60 % of all uses across the
// declared participants. Top 8 per person by count * uniqueness.
std::map<std::string, std::vector<CatchphraseEntry>> computeCatchphrases(
    const ConversationAccumulators& accs,
    const std::vector<std::string>& names);
