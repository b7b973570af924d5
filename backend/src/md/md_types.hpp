/*
Canonical market-data records produced by every provider
*/

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "decimal.hpp"

using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

// One bar, trade tick or quote midpoint for a symbol.
// Quote- and trade-derived records zero-fill open/high/low (and volume for quotes):
// zero there means "not applicable", not a real zero price.
struct MarketData
{
    std::string symbol;   // canonical "AAPL"
    Timestamp timestamp{};
    Decimal open, high, low, close;
    std::int64_t volume{0};
    std::optional<Decimal> vwap;
    std::optional<std::int64_t> trade_count;
    std::string provider; // "alpaca"

    bool has_range() const { return !(open.is_zero() && high.is_zero() && low.is_zero()); }

    // (high + low + close) / 3
    Decimal typical_price() const;
    Decimal price_range() const { return high - low; }

    // Empty when the record satisfies high >= low, non-negative prices and volume.
    std::optional<std::string> validation_error() const;
};

enum class OptionType : std::uint8_t
{
    Call = 0,
    Put = 1
};

const char* to_string(OptionType type);

// Absent fields mean "not computed", never zero.
struct Greeks
{
    std::optional<double> delta, gamma, theta, vega, rho;

    bool empty() const { return !delta && !gamma && !theta && !vega && !rho; }
};

struct OptionsQuote
{
    std::string underlying; // "AAPL"
    std::string contract;   // OCC "AAPL240119C00150000"
    Timestamp timestamp{};
    Decimal strike;
    Timestamp expiration{};
    OptionType type{OptionType::Call};
    Decimal bid, ask, last;
    std::int64_t volume{0};
    std::int64_t open_interest{0};
    std::optional<double> implied_volatility;
    std::optional<Greeks> greeks;

    Decimal mid_price() const { return bid.midpoint(ask); }
    Decimal spread() const { return ask - bid; }
    // Spread as a percentage of the midpoint; 0 when the midpoint is 0.
    double spread_percent() const;

    std::optional<std::string> validation_error() const;
};

// Opaque to the core; forwarded to REST headers and the stream auth message.
struct ProviderCredential
{
    std::string api_key;
    std::optional<std::string> api_secret;
};
