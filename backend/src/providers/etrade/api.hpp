#pragma once

#include <atomic>

#include "providers/market_data_provider.hpp"
#include "providers/provider_deps.hpp"

// E*TRADE is recognized but not integrated: its API needs OAuth 1.0a request
// signing, which the core does not implement. Every operation reports
// CapabilityNotSupported instead of returning fabricated data.
class EtradeProvider final : public IMarketDataProvider {
public:
    static constexpr const char *kName = "etrade";

    EtradeProvider(ProviderCredential credential, ProviderDeps deps);

    std::string name() const override { return kName; }
    CapabilitySet capabilities() const override { return {}; }

    void open() override;
    void close() noexcept override;
    bool is_open() const override { return open_.load(); }

    std::vector<MarketData> fetch_bars(const std::string &symbol,
                                       Timestamp start,
                                       Timestamp end,
                                       Timeframe tf) override;
    MarketData fetch_latest_quote(const std::string &symbol) override;
    void stream_trades(const std::vector<std::string> &symbols,
                       const TradeSink &sink,
                       std::stop_token stop) override;
    std::vector<OptionsQuote> fetch_options_chain(const std::string &symbol,
                                                  std::optional<Timestamp> expiration) override;

private:
    [[noreturn]] void unsupported(Capability cap, const std::string &symbol) const;

    ProviderCredential credential_;
    ProviderDeps deps_;
    std::atomic<bool> open_{false};
};
