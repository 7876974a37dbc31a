#include "calendar.hpp"
#include "analysis_constants.hpp"

#include <cstdio>
#include <ctime>
#include <sstream>

CalendarSlot calendarSlotFor(long long timestampMs)
{
    CalendarSlot slot;

    // floor division so pre-1970 timestamps land on the right second
    long long seconds = timestampMs / 1000;
    if (timestampMs % 1000 < 0)
        --seconds;

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm localTm{};
#ifdef _WIN32
    if (localtime_s(&localTm, &t) != 0)
        return slot;
#else
    if (localtime_r(&t, &localTm) == nullptr)
        return slot;
#endif

    slot.year    = localTm.tm_year + 1900;
    slot.month   = localTm.tm_mon + 1;
    slot.day     = localTm.tm_mday;
    slot.weekday = localTm.tm_wday;
    slot.hour    = localTm.tm_hour;
    return slot;
}

std::string monthKey(const CalendarSlot& slot)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", slot.year, slot.month);
    return buf;
}

std::string dayKey(const CalendarSlot& slot)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", slot.year, slot.month, slot.day);
    return buf;
}

bool isLateNight(const CalendarSlot& slot)
{
    return slot.hour >= LATE_NIGHT_START_HOUR || slot.hour < LATE_NIGHT_END_HOUR;
}

bool isWeekend(const CalendarSlot& slot)
{
    return slot.weekday == 0 || slot.weekday == 6;
}

// Implementation based on Howard Hinnant's days_from_civil.
long long daysFromCivil(int y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);          // [0, 399]
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1; // [0, 365]
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;         // [0, 146096]
    return static_cast<long long>(era * 146097 + static_cast<int>(doe) - 719468);
}

bool parseDayKey(const std::string& key, long long& daysOut)
{
    int year = 0, month = 0, day = 0;
    char sep1 = 0, sep2 = 0;

    std::istringstream ds(key);
    ds >> year >> sep1 >> month >> sep2 >> day;
    if (!ds || sep1 != '-' || sep2 != '-' || month < 1 || month > 12 || day < 1 || day > 31)
        return false;

    daysOut = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return true;
}
