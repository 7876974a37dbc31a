#pragma once

#include <string>
#include <vector>

#include "conversation.hpp"
#include "quant_types.hpp"

// Interaction graph of a group chat. Adjacent messages from different
// declared participants less than one session gap apart count as one
// directed interaction prev -> curr; pairs are then folded into undirected
// edges in participant order.
NetworkMetrics computeNetworkMetrics(const Conversation& conversation,
                                     const std::vector<std::string>& participantNames);
