#pragma once

#include <string>
#include <vector>

#include "analysis_constants.hpp"
#include "conversation.hpp"

// 2024-01-01 00:00:00 UTC, a Monday. Tests run with TZ=UTC.
static constexpr long long T0 = 1704067200000LL;
static constexpr long long MINUTE_MS = 60LL * 1000LL;

inline Message makeMessage(const std::string& sender, long long timestampMs,
                           const std::string& content = "hello there")
{
    Message m;
    m.sender      = sender;
    m.timestampMs = timestampMs;
    m.content     = content;
    return m;
}

inline Conversation makeConversation(const std::vector<std::string>& names,
                                     Platform platform = Platform::Messenger)
{
    Conversation c;
    c.platform = platform;
    for (const std::string& name : names)
    {
        Participant p;
        p.name = name;
        c.participants.push_back(p);
    }
    c.isGroup = names.size() > 2;
    return c;
}
