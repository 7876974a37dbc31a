#pragma once

#include "conversation.hpp"
#include "quant_types.hpp"

// Runs the whole quantitative engine over one conversation: a single pass over
// the messages followed by the derived metrics, trends, bursts, reciprocity,
// network graph (group chats only) and composite scores.
//
// Pure and deterministic for a fixed process time zone. Throws
// std::invalid_argument when a declared participant has an empty name or is
// declared twice; every other input is accepted.
QuantitativeAnalysis computeQuantitativeAnalysis(const Conversation& conversation);
