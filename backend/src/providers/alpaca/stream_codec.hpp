#pragma once
#include <simdjson.h>

#include <string>
#include <vector>

#include "stream/stream_codec.hpp"

// Alpaca market-data stream framing (v2):
//   -> {"action":"auth","key":"...","secret":"..."}
//   -> {"action":"subscribe","trades":["AAPL","TSLA"]}
//   <- [{"T":"success","msg":"connected"}]
//   <- [{"T":"success","msg":"authenticated"}] | [{"T":"error","code":402,"msg":"auth failed"}]
//   <- [{"T":"subscription","trades":["AAPL"],"quotes":[],"bars":[]}]
//   <- [{"T":"t","S":"AAPL","i":96921,"x":"D","p":126.55,"s":1,"t":"2021-02-22T15:51:44.208Z",...}, ...]
class AlpacaStreamCodec final : public IStreamCodec {
public:
    explicit AlpacaStreamCodec(std::string provider_tag = "alpaca") : provider_(std::move(provider_tag)) {}

    std::string auth_message(const ProviderCredential& credential) const override;
    std::string subscribe_message(const std::vector<std::string>& symbols) const override;
    void decode(const std::string& raw, std::vector<StreamEvent>& out) override;

    // Envelopes dropped because a required trade field was missing or malformed.
    std::size_t malformed() const { return malformed_; }

private:
    bool decode_trade(simdjson::ondemand::object& obj, MarketData& out) const;

    std::string provider_;
    simdjson::ondemand::parser parser_;
    std::size_t malformed_{0};
};
