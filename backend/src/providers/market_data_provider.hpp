#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "capability.hpp"
#include "md/md_types.hpp"
#include "md/timeframe.hpp"
#include "stream/stream_session.hpp"

// One vendor behind the four market-data operations.
//
// open() acquires the provider's transport resources and close() releases
// them; ProviderSession pairs the two. Operations outside the provider's
// capability set throw CapabilityNotSupported, and calling an operation on a
// provider that is not open throws std::logic_error.
//
// Operations may be called concurrently from several threads once open.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // Lower-case vendor id, also the `provider` tag on every record ("alpaca").
    virtual std::string name() const = 0;
    virtual CapabilitySet capabilities() const = 0;
    bool supports(Capability cap) const { return capabilities().contains(cap); }

    virtual void open() = 0;
    // Releases the HTTP client and cancels running streams. Idempotent.
    virtual void close() noexcept = 0;
    virtual bool is_open() const = 0;

    // Bars in [start, end], ascending by timestamp. Throws std::invalid_argument when start > end.
    // An empty vector means no data in the range.
    virtual std::vector<MarketData> fetch_bars(const std::string &symbol,
                                               Timestamp start,
                                               Timestamp end,
                                               Timeframe tf) = 0;

    // close = (bid + ask) / 2; open, high, low and volume are zero.
    virtual MarketData fetch_latest_quote(const std::string &symbol) = 0;

    // Blocks, calling `sink` once per trade in arrival order, until `stop` is
    // requested (returns) or the stream fails (throws).
    virtual void stream_trades(const std::vector<std::string> &symbols,
                               const TradeSink &sink,
                               std::stop_token stop) = 0;

    // Empty when the vendor has no options data for the symbol.
    virtual std::vector<OptionsQuote> fetch_options_chain(const std::string &symbol,
                                                          std::optional<Timestamp> expiration) = 0;
};
