#include "rest_parser.hpp"

#include <stdexcept>

#include "json_fields.hpp"
#include "md/occ_symbol.hpp"

namespace {

[[noreturn]] void fail(std::string_view what, simdjson::error_code err) {
    throw std::runtime_error("alpaca response: " + std::string(what) + ": " + simdjson::error_message(err));
}

// Reads "next_page_token" from the document root. null / missing -> nullopt.
std::optional<std::string> page_token(simdjson::ondemand::document& doc) {
    simdjson::ondemand::value v;
    if (doc["next_page_token"].get(v)) return std::nullopt;
    std::string_view token;
    if (v.get_string().get(token) || token.empty()) return std::nullopt;
    return std::string(token);
}

std::optional<double> optional_double(simdjson::ondemand::object& obj, std::string_view key) {
    double v = 0.0;
    if (!alpaca_json::read_double(obj, key, v)) return std::nullopt;
    return v;
}

} // namespace

std::string_view alpaca_timeframe(Timeframe tf) {
    switch (tf) {
        case Timeframe::Min1:   return "1Min";
        case Timeframe::Min5:   return "5Min";
        case Timeframe::Min15:  return "15Min";
        case Timeframe::Min30:  return "30Min";
        case Timeframe::Hour1:  return "1Hour";
        case Timeframe::Hour4:  return "4Hour";
        case Timeframe::Day1:   return "1Day";
        case Timeframe::Week1:  return "1Week";
        case Timeframe::Month1: return "1Month";
    }
    return "1Day";
}

AlpacaBarPage AlpacaRestParser::parse_bars(const std::string& body, const std::string& symbol,
                                           const std::string& provider) {
    simdjson::padded_string pj(body);
    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(pj).get(doc)) fail("bars body", err);

    AlpacaBarPage page;

    simdjson::ondemand::value bars_val;
    if (auto err = doc["bars"].get(bars_val)) fail("bars field", err);

    simdjson::ondemand::json_type type;
    if (auto err = bars_val.type().get(type)) fail("bars field", err);

    if (type != simdjson::ondemand::json_type::null) {
        simdjson::ondemand::array bars;
        if (auto err = bars_val.get_array().get(bars)) fail("bars field", err);

        for (auto element : bars) {
            simdjson::ondemand::object obj;
            if (element.get_object().get(obj)) {
                ++page.skipped;
                continue;
            }
            MarketData md;
            if (!parse_bar(obj, md)) {
                ++page.skipped;
                continue;
            }
            md.symbol = symbol;
            md.provider = provider;
            page.bars.push_back(std::move(md));
        }
    }

    page.next_page_token = page_token(doc);
    return page;
}

bool AlpacaRestParser::parse_bar(simdjson::ondemand::object& obj, MarketData& out) const {
    if (!alpaca_json::read_timestamp(obj, "t", out.timestamp)) return false;
    if (!alpaca_json::read_decimal(obj, "o", out.open)) return false;
    if (!alpaca_json::read_decimal(obj, "h", out.high)) return false;
    if (!alpaca_json::read_decimal(obj, "l", out.low)) return false;
    if (!alpaca_json::read_decimal(obj, "c", out.close)) return false;
    if (!alpaca_json::read_count(obj, "v", out.volume)) return false;

    // vwap and trade count are optional; zero is reported as absent
    Decimal vw;
    if (alpaca_json::read_decimal(obj, "vw", vw) && !vw.is_zero()) out.vwap = vw;
    std::int64_t n = 0;
    if (alpaca_json::read_count(obj, "n", n) && n != 0) out.trade_count = n;

    return !out.validation_error();
}

MarketData AlpacaRestParser::parse_latest_quote(const std::string& body, const std::string& symbol,
                                                const std::string& provider) {
    simdjson::padded_string pj(body);
    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(pj).get(doc)) fail("quote body", err);

    simdjson::ondemand::object quote;
    if (auto err = doc["quote"].get_object().get(quote)) fail("quote field", err);

    MarketData md;
    Decimal bid, ask;
    if (!alpaca_json::read_decimal(quote, "bp", bid)) throw std::runtime_error("alpaca response: quote without bp");
    if (!alpaca_json::read_decimal(quote, "ap", ask)) throw std::runtime_error("alpaca response: quote without ap");
    if (!alpaca_json::read_timestamp(quote, "t", md.timestamp)) throw std::runtime_error("alpaca response: quote without t");

    md.symbol = symbol;
    md.close = bid.midpoint(ask);
    // open/high/low/volume stay zero: a quote has no range
    md.provider = provider;
    return md;
}

AlpacaOptionPage AlpacaRestParser::parse_option_snapshots(const std::string& body,
                                                          const std::string& underlying) {
    simdjson::padded_string pj(body);
    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(pj).get(doc)) fail("snapshots body", err);

    AlpacaOptionPage page;

    simdjson::ondemand::value snaps_val;
    if (auto err = doc["snapshots"].get(snaps_val)) fail("snapshots field", err);
    simdjson::ondemand::json_type type;
    if (auto err = snaps_val.type().get(type)) fail("snapshots field", err);

    if (type != simdjson::ondemand::json_type::null) {
        simdjson::ondemand::object snaps;
        if (auto err = snaps_val.get_object().get(snaps)) fail("snapshots field", err);

        for (auto field : snaps) {
            std::string_view key;
            if (field.unescaped_key().get(key)) {
                ++page.skipped;
                continue;
            }
            const std::string contract(key);
            simdjson::ondemand::object snap;
            if (field.value().get_object().get(snap)) {
                ++page.skipped;
                continue;
            }
            OptionsQuote q;
            if (!parse_snapshot(contract, snap, underlying, q)) {
                ++page.skipped;
                continue;
            }
            page.quotes.push_back(std::move(q));
        }
    }

    page.next_page_token = page_token(doc);
    return page;
}

bool AlpacaRestParser::parse_snapshot(std::string_view contract, simdjson::ondemand::object& snap,
                                      const std::string& underlying, OptionsQuote& out) const {
    auto occ = OccSymbol::parse(contract);
    if (!occ) return false;

    out.underlying = underlying;
    out.contract = std::string(contract);
    out.strike = occ->strike;
    out.expiration = occ->expiration;
    out.type = occ->type;

    bool have_ts = false;

    simdjson::ondemand::object quote;
    if (!snap["latestQuote"].get_object().get(quote)) {
        if (!alpaca_json::read_decimal(quote, "bp", out.bid)) out.bid = Decimal{};
        if (!alpaca_json::read_decimal(quote, "ap", out.ask)) out.ask = Decimal{};
        have_ts = alpaca_json::read_timestamp(quote, "t", out.timestamp);
    }

    simdjson::ondemand::object trade;
    if (!snap["latestTrade"].get_object().get(trade)) {
        if (!alpaca_json::read_decimal(trade, "p", out.last)) out.last = Decimal{};
        Timestamp trade_ts{};
        if (alpaca_json::read_timestamp(trade, "t", trade_ts)) {
            if (!have_ts || trade_ts > out.timestamp) out.timestamp = trade_ts;
            have_ts = true;
        }
    }
    if (!have_ts) return false;

    simdjson::ondemand::object daily;
    if (!snap["dailyBar"].get_object().get(daily)) {
        if (!alpaca_json::read_count(daily, "v", out.volume)) out.volume = 0;
    }

    std::int64_t oi = 0;
    if (alpaca_json::read_count(snap, "openInterest", oi)) out.open_interest = oi;

    out.implied_volatility = optional_double(snap, "impliedVolatility");

    simdjson::ondemand::object greeks_obj;
    if (!snap["greeks"].get_object().get(greeks_obj)) {
        Greeks g;
        g.delta = optional_double(greeks_obj, "delta");
        g.gamma = optional_double(greeks_obj, "gamma");
        g.theta = optional_double(greeks_obj, "theta");
        g.vega = optional_double(greeks_obj, "vega");
        g.rho = optional_double(greeks_obj, "rho");
        if (!g.empty()) out.greeks = g;
    }

    return !out.validation_error();
}
