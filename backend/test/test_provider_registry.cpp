#include <gtest/gtest.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "fakes.hpp"
#include "md/time_codec.hpp"
#include "providers/provider_error.hpp"
#include "providers/provider_registry.hpp"
#include "providers/provider_session.hpp"

namespace {

ProviderDeps quiet_deps(const std::shared_ptr<HttpScript>& http) {
    ProviderDeps deps;
    deps.logger = std::make_shared<NullLogger>();
    deps.make_http = fake_http_factory(http);
    deps.connect_ws = fake_ws_connector(std::make_shared<WsScript>());
    return deps;
}

const ProviderCredential kCred{"key", std::string("secret")};

} // namespace

TEST(ProviderRegistryTest, CreatesAlpacaWithoutIo) {
    auto http = std::make_shared<HttpScript>();
    auto provider = create_provider("alpaca", kCred, quiet_deps(http));

    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->name(), "alpaca");
    EXPECT_TRUE(provider->supports(Capability::HistoricalBars));
    EXPECT_TRUE(provider->supports(Capability::TradeStream));
    EXPECT_FALSE(provider->is_open());
    EXPECT_EQ(http->clients_created, 0);
    EXPECT_TRUE(http->snapshot().empty());
}

TEST(ProviderRegistryTest, VendorIdsAreCaseInsensitive) {
    auto http = std::make_shared<HttpScript>();
    EXPECT_EQ(create_provider("ALPACA", kCred, quiet_deps(http))->name(), "alpaca");
    EXPECT_EQ(create_provider("ETrade", kCred, quiet_deps(http))->name(), "etrade");
}

TEST(ProviderRegistryTest, RecognizedButUnintegratedVendors) {
    for (const char* id : {"fidelity", "polygon", "iex"}) {
        try {
            (void)create_provider(id, kCred);
            FAIL() << id << " should not be constructible";
        } catch (const NotImplemented& e) {
            EXPECT_EQ(e.kind(), ProviderErrc::NotImplemented);
            EXPECT_EQ(e.vendor(), id);
        }
    }
}

TEST(ProviderRegistryTest, UnknownVendor) {
    try {
        (void)create_provider("bloomberg", kCred);
        FAIL() << "expected UnknownProvider";
    } catch (const UnknownProvider& e) {
        EXPECT_EQ(e.kind(), ProviderErrc::UnknownProvider);
        EXPECT_NE(std::string(e.what()).find("bloomberg"), std::string::npos);
    }
}

TEST(ProviderRegistryTest, ListsEveryRecognizedVendor) {
    const std::vector<std::string> expected = {"alpaca", "etrade", "fidelity", "iex", "polygon"};
    EXPECT_EQ(ProviderRegistry::instance().list_names(), expected);
    EXPECT_EQ(ProviderRegistry::instance().find("bloomberg"), nullptr);
}

TEST(EtradeProviderTest, EveryCapabilityIsUnsupported) {
    auto http = std::make_shared<HttpScript>();
    auto provider = create_provider("etrade", kCred, quiet_deps(http));
    ProviderSession session(*provider);

    EXPECT_FALSE(provider->supports(Capability::HistoricalBars));
    EXPECT_FALSE(provider->supports(Capability::LatestQuote));
    EXPECT_FALSE(provider->supports(Capability::TradeStream));
    EXPECT_FALSE(provider->supports(Capability::OptionsChain));

    const Timestamp start = TimeCodec::parse_iso8601("2024-01-01");
    const Timestamp end = TimeCodec::parse_iso8601("2024-01-05");
    try {
        (void)provider->fetch_bars("AAPL", start, end, Timeframe::Day1);
        FAIL() << "expected CapabilityNotSupported";
    } catch (const CapabilityNotSupported& e) {
        EXPECT_EQ(e.capability(), Capability::HistoricalBars);
        EXPECT_EQ(e.vendor(), "etrade");
        EXPECT_EQ(e.operation(), "fetch_bars");
        EXPECT_EQ(e.symbol(), "AAPL");
    }
    EXPECT_THROW((void)provider->fetch_latest_quote("AAPL"), CapabilityNotSupported);
    EXPECT_THROW((void)provider->fetch_options_chain("AAPL", std::nullopt), CapabilityNotSupported);
    EXPECT_THROW(provider->stream_trades({"AAPL"}, [](const MarketData&) {}, std::stop_token{}),
                 CapabilityNotSupported);

    // argument errors still come first
    EXPECT_THROW((void)provider->fetch_bars("AAPL", end, start, Timeframe::Day1), std::invalid_argument);
    EXPECT_TRUE(http->snapshot().empty());
}

TEST(ProviderErrorTest, MessageNamesVendorOperationAndSymbol) {
    const TransportFailure e("alpaca", "fetch_bars", "AAPL", "boom", 503);
    EXPECT_STREQ(e.what(), "alpaca fetch_bars(AAPL): transport failure: HTTP 503 boom");
    EXPECT_EQ(e.http_status(), 503);

    const CapabilityNotSupported c("etrade", Capability::OptionsChain);
    EXPECT_EQ(c.operation(), "fetch_options_chain");
}
