#pragma once

#include <string>
#include <vector>

// Normalized conversation as handed over by the platform importers.
// Messages are expected in ascending timestamp order; the engine never re-sorts.

enum class Platform
{
    Messenger,
    WhatsApp,
    Instagram,
    Telegram,
    Discord
};

// "messenger", "whatsapp", ... (case-insensitive). Unknown tags map to Messenger.
Platform platformFromString(const std::string& tag);
const char* platformToString(Platform platform);

// Gap that separates two sessions on the given platform.
long long sessionGapMs(Platform platform);

struct Reaction
{
    std::string emoji;
    std::string actor;
};

struct Message
{
    std::string sender;
    long long   timestampMs = 0;
    std::string content;

    std::vector<Reaction> reactions;

    bool hasMedia = false;
    bool hasLink  = false;
    bool isUnsent = false;

    // Display names @-mentioned in this message (Discord only).
    std::vector<std::string> mentions;

    // Index of the message this one replies to, -1 when it is not a reply (Discord only).
    long long replyToIndex = -1;
};

struct Participant
{
    std::string name;
    std::string platformId;
};

struct Conversation
{
    Platform    platform = Platform::Messenger;
    std::string title;

    std::vector<Participant> participants;
    std::vector<Message>     messages;

    bool isGroup = false;
};
