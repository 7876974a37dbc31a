#include "network.hpp"

#include <cstddef>
#include <unordered_map>

NetworkMetrics computeNetworkMetrics(const Conversation& conversation,
                                     const std::vector<std::string>& participantNames)
{
    NetworkMetrics net;
    const std::size_t n = participantNames.size();

    std::unordered_map<std::string, std::size_t> slot;
    for (std::size_t i = 0; i < n; ++i)
        slot.emplace(participantNames[i], i);

    std::vector<std::vector<long long>> matrix(n, std::vector<long long>(n, 0));
    std::vector<long long> totals(n, 0);

    const std::vector<Message>& messages = conversation.messages;
    const long long sessionGap = sessionGapMs(conversation.platform);

    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        auto cur = slot.find(messages[i].sender);
        if (cur != slot.end())
            totals[cur->second]++;

        if (i == 0 || cur == slot.end())
            continue;

        const Message& prev = messages[i - 1];
        if (prev.sender == messages[i].sender)
            continue;
        if (messages[i].timestampMs - prev.timestampMs >= sessionGap)
            continue;

        auto from = slot.find(prev.sender);
        if (from != slot.end())
            matrix[from->second][cur->second]++;
    }

    std::vector<long long> neighbors(n, 0);
    for (std::size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = i + 1; j < n; ++j)
        {
            const long long weight = matrix[i][j] + matrix[j][i];
            if (weight <= 0)
                continue;

            NetworkEdge edge;
            edge.from        = participantNames[i];
            edge.to          = participantNames[j];
            edge.weight      = weight;
            edge.fromToCount = matrix[i][j];
            edge.toFromCount = matrix[j][i];
            net.edges.push_back(edge);

            neighbors[i]++;
            neighbors[j]++;
        }
    }

    std::size_t best = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        NetworkNode node;
        node.name          = participantNames[i];
        node.totalMessages = totals[i];
        node.centrality    = n > 1 ? static_cast<double>(neighbors[i]) / static_cast<double>(n - 1) : 0.0;
        net.nodes.push_back(node);

        // strictly better only, so earlier participants win full ties
        const NetworkNode& top = net.nodes[best];
        if (node.centrality > top.centrality ||
            (node.centrality == top.centrality && node.totalMessages > top.totalMessages))
            best = i;
    }

    if (n > 1)
    {
        const double possible = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
        net.density = static_cast<double>(net.edges.size()) / possible;
    }
    if (n > 0)
        net.mostConnected = net.nodes[best].name;

    return net;
}
