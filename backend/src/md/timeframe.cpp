#include "timeframe.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, Timeframe>, 36> kSpellings = {{
    {"1m", Timeframe::Min1},     {"1min", Timeframe::Min1},   {"1Min", Timeframe::Min1},   {"1T", Timeframe::Min1},
    {"5m", Timeframe::Min5},     {"5min", Timeframe::Min5},   {"5Min", Timeframe::Min5},   {"5T", Timeframe::Min5},
    {"15m", Timeframe::Min15},   {"15min", Timeframe::Min15}, {"15Min", Timeframe::Min15}, {"15T", Timeframe::Min15},
    {"30m", Timeframe::Min30},   {"30min", Timeframe::Min30}, {"30Min", Timeframe::Min30}, {"30T", Timeframe::Min30},
    {"1h", Timeframe::Hour1},    {"1H", Timeframe::Hour1},    {"1Hour", Timeframe::Hour1}, {"60m", Timeframe::Hour1},
    {"4h", Timeframe::Hour4},    {"4H", Timeframe::Hour4},    {"4Hour", Timeframe::Hour4}, {"240m", Timeframe::Hour4},
    {"1d", Timeframe::Day1},     {"1D", Timeframe::Day1},     {"1Day", Timeframe::Day1},   {"1day", Timeframe::Day1},
    {"1w", Timeframe::Week1},    {"1W", Timeframe::Week1},    {"1Week", Timeframe::Week1}, {"1week", Timeframe::Week1},
    {"1M", Timeframe::Month1},   {"1Mo", Timeframe::Month1},  {"1Month", Timeframe::Month1}, {"1month", Timeframe::Month1},
}};

} // namespace

Timeframe parse_timeframe(std::string_view text)
{
    for (const auto &[spelling, tf] : kSpellings)
    {
        if (spelling == text) return tf;
    }
    throw std::invalid_argument("unknown timeframe '" + std::string(text) + "'");
}

std::string_view to_string(Timeframe tf)
{
    switch (tf)
    {
        case Timeframe::Min1:   return "1m";
        case Timeframe::Min5:   return "5m";
        case Timeframe::Min15:  return "15m";
        case Timeframe::Min30:  return "30m";
        case Timeframe::Hour1:  return "1h";
        case Timeframe::Hour4:  return "4h";
        case Timeframe::Day1:   return "1d";
        case Timeframe::Week1:  return "1w";
        case Timeframe::Month1: return "1M";
    }
    return "?";
}

std::chrono::seconds nominal_duration(Timeframe tf)
{
    using namespace std::chrono;
    switch (tf)
    {
        case Timeframe::Min1:   return minutes{1};
        case Timeframe::Min5:   return minutes{5};
        case Timeframe::Min15:  return minutes{15};
        case Timeframe::Min30:  return minutes{30};
        case Timeframe::Hour1:  return hours{1};
        case Timeframe::Hour4:  return hours{4};
        case Timeframe::Day1:   return hours{24};
        case Timeframe::Week1:  return hours{24 * 7};
        case Timeframe::Month1: return hours{24 * 30};
    }
    return seconds{0};
}
