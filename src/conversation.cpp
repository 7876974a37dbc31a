#include "conversation.hpp"
#include "analysis_constants.hpp"

#include <cctype>

static std::string toLowerAscii(std::string s)
{
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Platform platformFromString(const std::string& tag)
{
    std::string t = toLowerAscii(tag);

    if (t == "whatsapp")  return Platform::WhatsApp;
    if (t == "instagram") return Platform::Instagram;
    if (t == "telegram")  return Platform::Telegram;
    if (t == "discord")   return Platform::Discord;
    return Platform::Messenger;
}

const char* platformToString(Platform platform)
{
    switch (platform)
    {
        case Platform::Messenger: return "messenger";
        case Platform::WhatsApp:  return "whatsapp";
        case Platform::Instagram: return "instagram";
        case Platform::Telegram:  return "telegram";
        case Platform::Discord:   return "discord";
    }
    return "messenger";
}

long long sessionGapMs(Platform platform)
{
    return platform == Platform::Discord ? SESSION_GAP_DISCORD_MS
                                         : SESSION_GAP_DEFAULT_MS;
}
