#include "md_types.hpp"

Decimal MarketData::typical_price() const {
    return (high + low + close) / 3;
}

std::optional<std::string> MarketData::validation_error() const {
    if (high < low) {
        return "high " + high.to_string() + " below low " + low.to_string();
    }
    if (open.is_negative() || high.is_negative() || low.is_negative() || close.is_negative()) {
        return std::string("negative price");
    }
    if (volume < 0) {
        return "negative volume " + std::to_string(volume);
    }
    if (vwap && vwap->is_negative()) {
        return std::string("negative vwap");
    }
    return std::nullopt;
}

const char* to_string(OptionType type) {
    return type == OptionType::Call ? "CALL" : "PUT";
}

double OptionsQuote::spread_percent() const {
    const Decimal mid = mid_price();
    if (mid.is_zero()) return 0.0;
    return spread().to_double() / mid.to_double() * 100.0;
}

std::optional<std::string> OptionsQuote::validation_error() const {
    if (strike.is_negative() || strike.is_zero()) {
        return "non-positive strike " + strike.to_string();
    }
    if (bid.is_negative() || ask.is_negative() || last.is_negative()) {
        return std::string("negative price");
    }
    // An empty book side is reported as 0 by vendors; only a two-sided book is checked.
    if (!ask.is_zero() && bid > ask) {
        return "bid " + bid.to_string() + " above ask " + ask.to_string();
    }
    if (volume < 0 || open_interest < 0) {
        return std::string("negative volume or open interest");
    }
    return std::nullopt;
}
