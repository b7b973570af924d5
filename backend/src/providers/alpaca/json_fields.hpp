#pragma once
#include <simdjson.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <string>
#include <string_view>

#include "md/decimal.hpp"
#include "md/md_types.hpp"
#include "md/time_codec.hpp"

// simdjson ondemand field readers shared by the Alpaca REST and stream parsers.
// Each returns false when the field is missing or has the wrong shape.
namespace alpaca_json {

// Prices arrive as JSON numbers; the raw token is parsed so no double rounding happens.
inline bool read_decimal(simdjson::ondemand::value& v, Decimal& out) {
    simdjson::ondemand::json_type type;
    if (v.type().get(type)) return false;
    if (type == simdjson::ondemand::json_type::string) {
        std::string_view sv;
        if (v.get_string().get(sv)) return false;
        return Decimal::try_parse(sv, out);
    }
    if (type != simdjson::ondemand::json_type::number) return false;
    std::string_view raw = v.raw_json_token();
    return Decimal::try_parse(raw, out);
}

inline bool read_decimal(simdjson::ondemand::object& obj, std::string_view key, Decimal& out) {
    simdjson::ondemand::value v;
    if (obj[key].get(v)) return false;
    return read_decimal(v, out);
}

// Integral counts are read exactly over the full int64 range; fractional
// (crypto, odd-lot) values go through Decimal and are truncated.
inline bool read_count(simdjson::ondemand::object& obj, std::string_view key, std::int64_t& out) {
    simdjson::ondemand::value v;
    if (obj[key].get(v)) return false;
    simdjson::ondemand::json_type type;
    if (v.type().get(type)) return false;
    if (type == simdjson::ondemand::json_type::number) {
        std::string_view raw = v.raw_json_token();
        while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\t' || raw.back() == '\n' || raw.back() == '\r'))
            raw.remove_suffix(1);
        std::int64_t whole = 0;
        const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), whole);
        if (ec == std::errc::result_out_of_range) return false;
        if (ec == std::errc{} && end == raw.data() + raw.size()) {
            out = whole;
            return true;
        }
    }
    Decimal d;
    if (!read_decimal(v, d)) return false;
    out = (d / Decimal::kUnit).units();
    return true;
}

inline bool read_double(simdjson::ondemand::object& obj, std::string_view key, double& out) {
    simdjson::ondemand::value v;
    if (obj[key].get(v)) return false;
    return !v.get_double().get(out);
}

inline bool read_string(simdjson::ondemand::object& obj, std::string_view key, std::string_view& out) {
    return !obj[key].get_string().get(out);
}

// RFC-3339 text, or integer epoch milliseconds.
inline bool read_timestamp(simdjson::ondemand::object& obj, std::string_view key, Timestamp& out) {
    simdjson::ondemand::value v;
    if (obj[key].get(v)) return false;
    simdjson::ondemand::json_type type;
    if (v.type().get(type)) return false;
    if (type == simdjson::ondemand::json_type::string) {
        std::string_view sv;
        if (v.get_string().get(sv)) return false;
        return TimeCodec::try_parse_iso8601(sv, out);
    }
    std::int64_t ms = 0;
    if (v.get_int64().get(ms)) return false;
    out = TimeCodec::from_epoch_millis(ms);
    return true;
}

inline bool is_null(simdjson::ondemand::object& obj, std::string_view key) {
    simdjson::ondemand::value v;
    if (obj[key].get(v)) return true; // missing counts as null
    simdjson::ondemand::json_type type;
    if (v.type().get(type)) return true;
    return type == simdjson::ondemand::json_type::null;
}

} // namespace alpaca_json
