#include "best_time.hpp"

#include <algorithm>
#include <cstdio>

static const char* const DAY_NAMES[7] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

const char* weekdayName(int weekday)
{
    if (weekday < 0 || weekday > 6)
        return "";
    return DAY_NAMES[weekday];
}

static std::string formatHour(int hour)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:00", hour);
    return buf;
}

std::map<std::string, BestTimeToText> computeBestTimeToText(const HeatmapData& heatmap,
                                                            const TimingMetrics& timing,
                                                            const std::vector<std::string>& names)
{
    std::map<std::string, BestTimeToText> result;

    for (const std::string& name : names)
    {
        BestTimeToText best;

        auto rt = timing.perPerson.find(name);
        if (rt != timing.perPerson.end())
            best.avgResponseMs = rt->second.medianResponseTimeMs;

        int bestDay = 0;
        int bestHour = 0;
        auto grid = heatmap.perPerson.find(name);
        if (grid != heatmap.perPerson.end())
        {
            long long maxCount = 0;
            for (int day = 0; day < 7; ++day)
            {
                for (int hour = 0; hour < 24; ++hour)
                {
                    if (grid->second[day][hour] > maxCount)
                    {
                        maxCount = grid->second[day][hour];
                        bestDay  = day;
                        bestHour = hour;
                    }
                }
            }
        }

        const int windowEnd = std::min(bestHour + 2, 24);

        best.bestDay    = weekdayName(bestDay);
        best.bestHour   = bestHour;
        best.bestWindow = std::string(weekdayName(bestDay)) + "s " +
                          formatHour(bestHour) + "-" + formatHour(windowEnd);
        result[name] = best;
    }

    return result;
}
