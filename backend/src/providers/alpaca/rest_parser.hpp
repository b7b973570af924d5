#pragma once
#include <simdjson.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "md/md_types.hpp"
#include "md/timeframe.hpp"

// Alpaca spelling of a bar interval: "1Min", "15Min", "1Hour", "1Day", "1Week", "1Month".
std::string_view alpaca_timeframe(Timeframe tf);

struct AlpacaBarPage {
    std::vector<MarketData> bars;
    std::size_t skipped{0};                     // entries with missing or invalid fields
    std::optional<std::string> next_page_token; // set when the server truncated the result
};

struct AlpacaOptionPage {
    std::vector<OptionsQuote> quotes;
    std::size_t skipped{0};
    std::optional<std::string> next_page_token;
};

// Parses Alpaca market-data REST bodies. Holds a simdjson parser, so one
// instance per request (or per thread).
//
// Bodies that are not the expected JSON document throw std::runtime_error;
// single malformed entries inside a well-formed body are counted and skipped.
class AlpacaRestParser {
public:
    AlpacaRestParser() = default;

    // {"bars":[{"t":"2024-01-02T05:00:00Z","o":..,"h":..,"l":..,"c":..,"v":..,"n":..,"vw":..}],
    //  "symbol":"AAPL","next_page_token":null}
    // "bars":null means no data in the range.
    AlpacaBarPage parse_bars(const std::string& body, const std::string& symbol,
                             const std::string& provider);

    // {"symbol":"AAPL","quote":{"t":"..","bp":..,"bs":..,"ap":..,"as":..}}
    MarketData parse_latest_quote(const std::string& body, const std::string& symbol,
                                  const std::string& provider);

    // {"snapshots":{"AAPL240119C00150000":{"latestQuote":{..},"latestTrade":{..},
    //   "dailyBar":{..},"impliedVolatility":..,"greeks":{..}}},"next_page_token":null}
    AlpacaOptionPage parse_option_snapshots(const std::string& body, const std::string& underlying);

private:
    bool parse_bar(simdjson::ondemand::object& obj, MarketData& out) const;
    bool parse_snapshot(std::string_view contract, simdjson::ondemand::object& snap,
                        const std::string& underlying, OptionsQuote& out) const;

    simdjson::ondemand::parser parser_;
};
