#include "bursts.hpp"
#include "analysis_constants.hpp"
#include "calendar.hpp"

struct DayCount
{
    std::string day;
    long long   count = 0;
    long long   dayNumber = 0; // days since epoch
};

static BurstPeriod toPeriod(const std::string& start, const std::string& end,
                            long long messages, long long days)
{
    BurstPeriod p;
    p.startDate    = start;
    p.endDate      = end;
    p.messageCount = messages;
    p.avgDaily     = days > 0 ? static_cast<double>(messages) / static_cast<double>(days) : 0.0;
    return p;
}

std::vector<BurstPeriod> detectBursts(const std::map<std::string, long long>& dailyCounts)
{
    std::vector<BurstPeriod> bursts;
    if (dailyCounts.size() < BURST_MIN_DAYS)
        return bursts;

    // std::map keeps YYYY-MM-DD keys in chronological order.
    std::vector<DayCount> days;
    days.reserve(dailyCounts.size());
    double total = 0.0;
    for (const auto& kv : dailyCounts)
    {
        DayCount d;
        d.day   = kv.first;
        d.count = kv.second;
        if (!parseDayKey(kv.first, d.dayNumber))
            continue;
        total += static_cast<double>(kv.second);
        days.push_back(d);
    }
    if (days.size() < BURST_MIN_DAYS)
        return bursts;

    const double overallAvg = total / static_cast<double>(days.size());

    std::vector<const DayCount*> burstDays;
    double windowSum = 0.0;
    for (std::size_t i = 0; i < days.size(); ++i)
    {
        double baseline = overallAvg;
        if (i >= BURST_WINDOW)
            baseline = windowSum / static_cast<double>(BURST_WINDOW);

        if (baseline > 0.0 && static_cast<double>(days[i].count) > BURST_MULTIPLIER * baseline)
            burstDays.push_back(&days[i]);

        // slide the trailing window forward to cover days [i-6, i]
        windowSum += static_cast<double>(days[i].count);
        if (i >= BURST_WINDOW)
            windowSum -= static_cast<double>(days[i - BURST_WINDOW].count);
    }

    if (burstDays.empty())
        return bursts;

    std::string start    = burstDays[0]->day;
    std::string end      = burstDays[0]->day;
    long long   lastDay  = burstDays[0]->dayNumber;
    long long   messages = burstDays[0]->count;
    long long   span     = 1;

    for (std::size_t i = 1; i < burstDays.size(); ++i)
    {
        const DayCount& d = *burstDays[i];
        if (d.dayNumber - lastDay <= 1)
        {
            end       = d.day;
            lastDay   = d.dayNumber;
            messages += d.count;
            span++;
        }
        else
        {
            bursts.push_back(toPeriod(start, end, messages, span));
            start    = d.day;
            end      = d.day;
            lastDay  = d.dayNumber;
            messages = d.count;
            span     = 1;
        }
    }
    bursts.push_back(toPeriod(start, end, messages, span));

    return bursts;
}
