#pragma once

#include <vector>

// Small numeric helpers shared by the derived metrics and score layers.
// Every function returns a finite value; empty input yields 0.

double clampValue(double value, double lo, double hi);

// 0 when the denominator is 0 or the quotient is not finite.
double safeDivide(double numerator, double denominator);

// Half-up rounding of non-negative scores (Math.round semantics).
double roundHalfUp(double value);

double mean(const std::vector<double>& values);

// Standard even/odd median of the sorted samples.
double median(std::vector<double> values);

// Value at percentile p (0..100) of an ascending-sorted sample, linear
// interpolation between closest ranks.
double percentileSorted(const std::vector<double>& sorted, double p);

// Population standard deviation; 0 for fewer than 2 samples.
double populationStdDev(const std::vector<double>& values);

// Mean after dropping the lowest and highest `trimFraction` of samples.
// Falls back to the median when trimming would leave nothing.
double trimmedMean(const std::vector<double>& values, double trimFraction);

// Fisher-Pearson skewness; 0 for fewer than 3 samples or zero deviation.
double skewness(const std::vector<double>& values);

// OLS slope of value against index 0..k-1:
//   slope = (k*Sxy - Sx*Sy) / (k*Sxx - Sx^2)
// Non-finite samples are skipped; 0 when k < 2 or the denominator is 0.
double linearRegressionSlope(const std::vector<double>& values);
