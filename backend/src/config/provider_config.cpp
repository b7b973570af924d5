#include "provider_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace {

std::string lower(std::string s) {
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string upper(std::string s) {
    for (auto &ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

// Unset and empty are both "not configured".
std::optional<std::string> env(const std::string &name) {
    const char *v = std::getenv(name.c_str());
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

} // namespace

ProviderEndpoints default_endpoints(const std::string &vendor) {
    const std::string id = lower(vendor);
    if (id == "alpaca") {
        return {"https://data.alpaca.markets", "wss://stream.data.alpaca.markets/v2/iex", "iex"};
    }
    if (id == "etrade") {
        return {"https://api.etrade.com", "", ""};
    }
    if (id == "polygon") {
        return {"https://api.polygon.io", "wss://socket.polygon.io/stocks", ""};
    }
    if (id == "iex") {
        return {"https://cloud.iexapis.com", "", ""};
    }
    return {};
}

bool load_env_file(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return false; // rely on the process environment
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        if (key.rfind("export ", 0) == 0) {
            key.erase(0, 7);
            key.erase(0, key.find_first_not_of(" \t"));
        }
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        if (key.empty()) {
            continue;
        }

        // Remove quotes if present
        if (value.size() >= 2 && value[0] == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        } else if (value.size() >= 2 && value[0] == '\'' && value.back() == '\'') {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
    return true;
}

ProviderConfig provider_config_from_env(const std::string &vendor) {
    ProviderConfig cfg;
    cfg.vendor = lower(vendor);
    cfg.endpoints = default_endpoints(cfg.vendor);

    const std::string prefix = upper(cfg.vendor);
    const std::string key_var = prefix + "_API_KEY";
    const std::string secret_var = prefix + "_API_SECRET";

    auto key = env(key_var);
    auto secret = env(secret_var);
    if (cfg.vendor == "alpaca") {
        if (!key) key = env("APCA_API_KEY_ID");
        if (!secret) secret = env("APCA_API_SECRET_KEY");
    }
    if (!key) {
        throw std::runtime_error("missing environment variable " + key_var);
    }
    cfg.credential.api_key = *key;
    cfg.credential.api_secret = secret;

    if (cfg.vendor == "alpaca") {
        if (auto url = env("ALPACA_DATA_URL")) cfg.endpoints.rest_base = *url;
        if (auto feed = env("ALPACA_FEED")) {
            const std::string f = lower(*feed);
            if (f != "iex" && f != "sip") {
                throw std::runtime_error("ALPACA_FEED must be 'iex' or 'sip', got '" + *feed + "'");
            }
            cfg.endpoints.feed = f;
            cfg.endpoints.stream_url = "wss://stream.data.alpaca.markets/v2/" + f;
        }
        if (auto url = env("ALPACA_STREAM_URL")) cfg.endpoints.stream_url = *url;
    }

    // trailing slash would double up in request paths
    while (!cfg.endpoints.rest_base.empty() && cfg.endpoints.rest_base.back() == '/') {
        cfg.endpoints.rest_base.pop_back();
    }
    return cfg;
}
