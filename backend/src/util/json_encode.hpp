#pragma once
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "md/md_types.hpp"
#include "md/time_codec.hpp"

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xf];
                    out += hex[c & 0xf];
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// Decimals are written as exact JSON numbers, never through a double.
inline void json_field(std::ostringstream& os, const char* key, const Decimal& d) {
    os << "\"" << key << "\":" << d.to_string();
}

inline void json_field(std::ostringstream& os, const char* key, std::string_view s) {
    os << "\"" << key << "\":\"" << json_escape(s) << "\"";
}

inline void json_field(std::ostringstream& os, const char* key, const std::optional<double>& v) {
    os << "\"" << key << "\":";
    if (v) {
        os.precision(10);
        os << *v;
    } else {
        os << "null";
    }
}

// One line per record:
// {"symbol":"AAPL","timestamp":"2024-01-02T05:00:00Z","open":185.64,...,"provider":"alpaca"}
inline std::string to_json(const MarketData& md) {
    std::ostringstream os;
    os << "{";
    json_field(os, "symbol", md.symbol); os << ",";
    json_field(os, "timestamp", TimeCodec::to_iso8601(md.timestamp)); os << ",";
    json_field(os, "open", md.open); os << ",";
    json_field(os, "high", md.high); os << ",";
    json_field(os, "low", md.low); os << ",";
    json_field(os, "close", md.close); os << ",";
    os << "\"volume\":" << md.volume << ",";
    if (md.vwap) {
        json_field(os, "vwap", *md.vwap);
    } else {
        os << "\"vwap\":null";
    }
    os << ",\"trade_count\":";
    if (md.trade_count) os << *md.trade_count; else os << "null";
    os << ",";
    json_field(os, "provider", md.provider);
    os << "}";
    return os.str();
}

inline std::string to_json(const OptionsQuote& q) {
    std::ostringstream os;
    os << "{";
    json_field(os, "underlying", q.underlying); os << ",";
    json_field(os, "contract", q.contract); os << ",";
    json_field(os, "timestamp", TimeCodec::to_iso8601(q.timestamp)); os << ",";
    json_field(os, "type", to_string(q.type)); os << ",";
    json_field(os, "strike", q.strike); os << ",";
    json_field(os, "expiration", TimeCodec::to_date(q.expiration)); os << ",";
    json_field(os, "bid", q.bid); os << ",";
    json_field(os, "ask", q.ask); os << ",";
    json_field(os, "last", q.last); os << ",";
    os << "\"volume\":" << q.volume << ",";
    os << "\"open_interest\":" << q.open_interest << ",";
    json_field(os, "implied_volatility", q.implied_volatility);
    os << ",\"greeks\":";
    if (q.greeks) {
        os << "{";
        json_field(os, "delta", q.greeks->delta); os << ",";
        json_field(os, "gamma", q.greeks->gamma); os << ",";
        json_field(os, "theta", q.greeks->theta); os << ",";
        json_field(os, "vega", q.greeks->vega); os << ",";
        json_field(os, "rho", q.greeks->rho);
        os << "}";
    } else {
        os << "null";
    }
    os << "}";
    return os.str();
}
