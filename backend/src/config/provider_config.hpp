#pragma once

#include <string>

#include "md/md_types.hpp"

// Where a vendor's REST and streaming APIs live.
struct ProviderEndpoints {
    std::string rest_base;  // "https://data.alpaca.markets"
    std::string stream_url; // "wss://stream.data.alpaca.markets/v2/iex"; empty when the vendor has no stream
    std::string feed;       // Alpaca data feed: "iex" or "sip"
};

// Built-in endpoints for a vendor id ("alpaca", "etrade", ...). Unknown ids get empty endpoints.
ProviderEndpoints default_endpoints(const std::string &vendor);

// Credential plus endpoints, as resolved from the environment.
struct ProviderConfig {
    std::string vendor;
    ProviderCredential credential;
    ProviderEndpoints endpoints;
};

// Load KEY=VALUE lines into the environment. Existing variables win.
// A missing file is not an error; returns false in that case.
bool load_env_file(const std::string &filepath = ".env");

// Reads <VENDOR>_API_KEY / <VENDOR>_API_SECRET (Alpaca also accepts
// APCA_API_KEY_ID / APCA_API_SECRET_KEY) and, for Alpaca, ALPACA_DATA_URL,
// ALPACA_STREAM_URL and ALPACA_FEED.
// Throws std::runtime_error naming the variable when the key is missing or a value is invalid.
ProviderConfig provider_config_from_env(const std::string &vendor);
