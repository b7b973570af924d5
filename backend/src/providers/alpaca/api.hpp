#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "providers/market_data_provider.hpp"
#include "providers/provider_deps.hpp"
#include "transport/http_client.hpp"

// Alpaca market data: bars, latest quotes and option snapshots over REST,
// trades over the v2 WebSocket stream.
class AlpacaProvider final : public IMarketDataProvider {
public:
    static constexpr const char *kName = "alpaca";
    // Upper bound Alpaca accepts for one bars request.
    static constexpr int kBarLimit = 10000;
    static constexpr int kOptionPageLimit = 1000;

    // No I/O. Throws std::invalid_argument when the configured stream URL is not wss://.
    AlpacaProvider(ProviderCredential credential, ProviderDeps deps);
    ~AlpacaProvider() override;

    std::string name() const override { return kName; }
    CapabilitySet capabilities() const override;

    void open() override;
    void close() noexcept override;
    bool is_open() const override;

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

    const ProviderEndpoints &endpoints() const { return *deps_.endpoints; }

private:
    std::shared_ptr<IHttpClient> http_for(const char *operation) const;
    HttpHeaders auth_headers() const;
    // Network failures become TransportFailure; 401/403 become AuthenticationFailed.
    HttpResponse get(const char *operation, const std::string &symbol,
                     const std::string &url, const QueryParams &query);
    std::string venue_symbol(const char *operation, const std::string &symbol) const;

    ProviderCredential credential_;
    ProviderDeps deps_;
    std::optional<WsEndpoint> stream_endpoint_;

    mutable std::mutex m_;
    std::shared_ptr<IHttpClient> http_; // null while closed
    std::stop_source closing_;          // cancels running streams on close()
};
