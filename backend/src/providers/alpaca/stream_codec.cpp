#include "stream_codec.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "json_fields.hpp"
#include "md/symbol_codec.hpp"

using json = nlohmann::json;

namespace {

// Error codes Alpaca sends for a rejected or missing login.
bool is_auth_error(int code) {
    switch (code) {
        case 401: // not authenticated
        case 402: // auth failed
        case 403: // already authenticated
        case 404: // auth timeout
        case 406: // connection limit exceeded
        case 409: // insufficient subscription
            return true;
        default:
            return false;
    }
}

} // namespace

std::string AlpacaStreamCodec::auth_message(const ProviderCredential& credential) const {
    json msg = {
        {"action", "auth"},
        {"key", credential.api_key},
        {"secret", credential.api_secret.value_or("")}
    };
    return msg.dump();
}

std::string AlpacaStreamCodec::subscribe_message(const std::vector<std::string>& symbols) const {
    json trades = json::array();
    for (const auto& s : symbols) {
        trades.push_back(SymbolCodec::to_venue(provider_, s));
    }
    json msg = {{"action", "subscribe"}, {"trades", trades}};
    return msg.dump();
}

void AlpacaStreamCodec::decode(const std::string& raw, std::vector<StreamEvent>& out) {
    // Make a safely padded copy for simdjson ondemand
    simdjson::padded_string pj(raw);
    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(pj).get(doc)) {
        throw std::runtime_error(std::string("alpaca stream frame: ") + simdjson::error_message(err));
    }
    simdjson::ondemand::array envelopes;
    if (auto err = doc.get_array().get(envelopes)) {
        throw std::runtime_error(std::string("alpaca stream frame is not an array: ") + simdjson::error_message(err));
    }

    for (auto element : envelopes) {
        simdjson::ondemand::object obj;
        if (element.get_object().get(obj)) {
            ++malformed_;
            continue;
        }

        std::string_view type;
        if (!alpaca_json::read_string(obj, "T", type)) {
            ++malformed_;
            continue;
        }

        if (type == "t") {
            MarketData trade;
            if (decode_trade(obj, trade)) {
                out.emplace_back(std::move(trade));
            } else {
                ++malformed_;
            }
            continue;
        }

        ControlMessage ctl;
        if (type == "success") {
            std::string_view msg;
            if (alpaca_json::read_string(obj, "msg", msg)) ctl.detail = std::string(msg);
            if (msg == "connected") ctl.kind = ControlKind::Connected;
            else if (msg == "authenticated") ctl.kind = ControlKind::Authenticated;
            else ctl.kind = ControlKind::Other;
        } else if (type == "subscription") {
            ctl.kind = ControlKind::Subscribed;
            ctl.detail = "subscription";
        } else if (type == "error") {
            std::int64_t code = 0;
            if (alpaca_json::read_count(obj, "code", code)) ctl.code = static_cast<int>(code);
            std::string_view msg;
            if (alpaca_json::read_string(obj, "msg", msg)) ctl.detail = std::string(msg);
            ctl.kind = is_auth_error(ctl.code) ? ControlKind::AuthRejected : ControlKind::Error;
        } else {
            // quotes, bars, statuses, corrections, cancels
            ctl.kind = ControlKind::Other;
            ctl.detail = "envelope type '" + std::string(type) + "'";
        }
        out.emplace_back(std::move(ctl));
    }
}

bool AlpacaStreamCodec::decode_trade(simdjson::ondemand::object& obj, MarketData& out) const {
    std::string_view sym;
    if (!alpaca_json::read_string(obj, "S", sym)) return false;
    if (!alpaca_json::read_decimal(obj, "p", out.close)) return false;
    if (!alpaca_json::read_count(obj, "s", out.volume)) return false;
    if (!alpaca_json::read_timestamp(obj, "t", out.timestamp)) return false;
    if (out.close.is_negative() || out.volume < 0) return false;

    out.symbol = SymbolCodec::to_canonical(provider_, std::string(sym));
    // trade ticks carry no range
    out.open = out.high = out.low = Decimal{};
    out.provider = provider_;
    return true;
}
