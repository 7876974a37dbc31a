#pragma once

#include <string>

// Local calendar placement of a message timestamp. Every time-bucketed metric
// (heatmap, months, days, late night, weekend) goes through this so they all
// agree on the same calendar.
struct CalendarSlot
{
    int year    = 1970;
    int month   = 1;  // 1..12
    int day     = 1;  // 1..31
    int weekday = 4;  // 0 = Sunday
    int hour    = 0;  // 0..23
};

CalendarSlot calendarSlotFor(long long timestampMs);

// "YYYY-MM" and "YYYY-MM-DD"; both sort chronologically as plain strings.
std::string monthKey(const CalendarSlot& slot);
std::string dayKey(const CalendarSlot& slot);

bool isLateNight(const CalendarSlot& slot);
bool isWeekend(const CalendarSlot& slot);

// Days since 1970-01-01 for a civil date (Howard Hinnant's days_from_civil).
long long daysFromCivil(int y, unsigned m, unsigned d);

// Parses a "YYYY-MM-DD" key. Returns false when the key is malformed.
bool parseDayKey(const std::string& key, long long& daysOut);
