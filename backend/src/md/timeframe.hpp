#pragma once
#include <chrono>
#include <string_view>

// Bar intervals understood by the core.
enum class Timeframe
{
    Min1,
    Min5,
    Min15,
    Min30,
    Hour1,
    Hour4,
    Day1,
    Week1,
    Month1
};

// Accepts canonical spellings ("1m", "1h", "1d", "1w", "1M") and common vendor
// ones ("1Min", "1H", "1D", "1Day", ...). Case matters: "1m" is a minute, "1M" a month.
// Throws std::invalid_argument.
Timeframe parse_timeframe(std::string_view text);

// Canonical spelling: "1m", "5m", ..., "1d", "1w", "1M".
std::string_view to_string(Timeframe tf);

// Nominal length; months count as 30 days.
std::chrono::seconds nominal_duration(Timeframe tf);
