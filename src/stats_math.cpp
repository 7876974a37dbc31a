#include "stats_math.hpp"

#include <algorithm>
#include <cmath>

double clampValue(double value, double lo, double hi)
{
    if (!std::isfinite(value)) return lo;
    return std::min(hi, std::max(lo, value));
}

double safeDivide(double numerator, double denominator)
{
    if (denominator == 0.0)
        return 0.0;
    double result = numerator / denominator;
    return std::isfinite(result) ? result : 0.0;
}

double roundHalfUp(double value)
{
    return std::floor(value + 0.5);
}

double mean(const std::vector<double>& values)
{
    if (values.empty())
        return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double median(std::vector<double> values)
{
    if (values.empty())
        return 0.0;

    std::sort(values.begin(), values.end());
    std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 0)
        return (values[mid - 1] + values[mid]) / 2.0;
    return values[mid];
}

double percentileSorted(const std::vector<double>& sorted, double p)
{
    if (sorted.empty())
        return 0.0;

    double idx = (p / 100.0) * static_cast<double>(sorted.size() - 1);
    std::size_t lo = static_cast<std::size_t>(std::floor(idx));
    std::size_t hi = static_cast<std::size_t>(std::ceil(idx));
    if (lo == hi)
        return sorted[lo];
    return sorted[lo] + (sorted[hi] - sorted[lo]) * (idx - static_cast<double>(lo));
}

double populationStdDev(const std::vector<double>& values)
{
    if (values.size() < 2)
        return 0.0;

    double m = mean(values);
    double sumSq = 0.0;
    for (double v : values)
        sumSq += (v - m) * (v - m);
    return std::sqrt(sumSq / static_cast<double>(values.size()));
}

double trimmedMean(const std::vector<double>& values, double trimFraction)
{
    if (values.empty())
        return 0.0;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    std::size_t trimCount = static_cast<std::size_t>(
        std::floor(static_cast<double>(sorted.size()) * trimFraction));
    if (trimCount * 2 >= sorted.size())
        return median(values);

    double sum = 0.0;
    for (std::size_t i = trimCount; i < sorted.size() - trimCount; ++i)
        sum += sorted[i];
    return sum / static_cast<double>(sorted.size() - 2 * trimCount);
}

double skewness(const std::vector<double>& values)
{
    if (values.size() < 3)
        return 0.0;

    double m  = mean(values);
    double sd = populationStdDev(values);
    if (sd == 0.0)
        return 0.0;

    double m3 = 0.0;
    for (double v : values)
    {
        double z = (v - m) / sd;
        m3 += z * z * z;
    }
    return m3 / static_cast<double>(values.size());
}

double linearRegressionSlope(const std::vector<double>& values)
{
    double k = 0.0, sx = 0.0, sy = 0.0, sxy = 0.0, sxx = 0.0;

    for (double y : values)
    {
        if (!std::isfinite(y))
            continue;
        double x = k;
        sx  += x;
        sy  += y;
        sxy += x * y;
        sxx += x * x;
        k   += 1.0;
    }

    if (k < 2.0)
        return 0.0;

    double denominator = k * sxx - sx * sx;
    if (denominator == 0.0)
        return 0.0;

    double slope = (k * sxy - sx * sy) / denominator;
    return std::isfinite(slope) ? slope : 0.0;
}
