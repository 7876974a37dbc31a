#pragma once

#include <cstddef>
#include <string>

#include "conversation.hpp"
#include "quant_types.hpp"

// Fixed-width comparative text report: one label column, one column per
// participant.
std::string renderTextReport(const Conversation& conversation, const QuantitativeAnalysis& analysis);

// 1234567 -> "1,234,567"
std::string formatWithCommas(long long value);

// "2.00 min (120.00 s)"
std::string formatResponseTime(double ms);

// "3 d 4 h 5 min"
std::string formatDuration(long long ms);

// Single line, cut to maxLen bytes with a trailing "...".
std::string abbreviateContent(const std::string& input, std::size_t maxLen);
