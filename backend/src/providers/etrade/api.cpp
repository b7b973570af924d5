#include "api.hpp"

#include <stdexcept>

#include "md/time_codec.hpp"
#include "providers/provider_error.hpp"

namespace {
constexpr const char *kTag = "etrade";
}

EtradeProvider::EtradeProvider(ProviderCredential credential, ProviderDeps deps)
    : credential_(std::move(credential))
    , deps_(resolve_deps(kName, std::move(deps))) {}

void EtradeProvider::open() {
    if (!open_.exchange(true)) {
        deps_.logger->warn(kTag, "E*TRADE integration requires OAuth 1.0a setup; no market data operations available");
    }
}

void EtradeProvider::close() noexcept { open_.store(false); }

void EtradeProvider::unsupported(Capability cap, const std::string &symbol) const {
    deps_.logger->warn(kTag, std::string(to_string(cap)) + " requires OAuth 1.0a");
    throw CapabilityNotSupported(kName, cap, symbol);
}

std::vector<MarketData> EtradeProvider::fetch_bars(const std::string &symbol,
                                                   Timestamp start,
                                                   Timestamp end,
                                                   Timeframe) {
    if (start > end) {
        throw std::invalid_argument("etrade: fetch_bars start " + TimeCodec::to_iso8601(start) +
                                    " is after end " + TimeCodec::to_iso8601(end));
    }
    unsupported(Capability::HistoricalBars, symbol);
}

MarketData EtradeProvider::fetch_latest_quote(const std::string &symbol) {
    unsupported(Capability::LatestQuote, symbol);
}

void EtradeProvider::stream_trades(const std::vector<std::string> &symbols,
                                   const TradeSink &,
                                   std::stop_token) {
    std::string label;
    for (const auto &s : symbols) {
        if (!label.empty()) label += ",";
        label += s;
    }
    unsupported(Capability::TradeStream, label);
}

std::vector<OptionsQuote> EtradeProvider::fetch_options_chain(const std::string &symbol,
                                                              std::optional<Timestamp>) {
    unsupported(Capability::OptionsChain, symbol);
}
