#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "fakes.hpp"
#include "md/time_codec.hpp"
#include "providers/alpaca/api.hpp"
#include "providers/provider_error.hpp"
#include "providers/provider_session.hpp"

namespace {

constexpr const char* kBase = "https://data.test";

const char* kThreeBars = R"({
  "bars": [
    {"t":"2024-01-02T05:00:00Z","o":187.15,"h":188.44,"l":183.885,"c":185.64,"v":82488674,"n":1009074,"vw":185.817},
    {"t":"2024-01-03T05:00:00Z","o":184.22,"h":185.88,"l":183.43,"c":184.25,"v":58414460,"n":656956,"vw":184.3186},
    {"t":"2024-01-04T05:00:00Z","o":182.15,"h":183.0872,"l":180.88,"c":181.91,"v":71983570,"n":712920,"vw":181.9939}
  ],
  "symbol": "AAPL",
  "next_page_token": null
})";

class AlpacaRestTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<HttpScript>();
        log = std::make_shared<CapturingLogger>();

        ProviderDeps deps;
        deps.logger = log;
        deps.make_http = fake_http_factory(http);
        deps.connect_ws = fake_ws_connector(std::make_shared<WsScript>());
        deps.endpoints = ProviderEndpoints{kBase, "wss://stream.test/v2/iex", "iex"};

        provider = std::make_unique<AlpacaProvider>(ProviderCredential{"key-id", std::string("secret-key")}, deps);
        provider->open();
    }

    void respond(long status, std::string body) {
        std::lock_guard<std::mutex> lk(http->m);
        http->handler = [status, body](const RecordedRequest&) { return HttpResponse{status, body}; };
    }

    static Timestamp at(const char* text) { return TimeCodec::parse_iso8601(text); }

    std::shared_ptr<HttpScript> http;
    std::shared_ptr<CapturingLogger> log;
    std::unique_ptr<AlpacaProvider> provider;
};

} // namespace

TEST_F(AlpacaRestTest, FetchBarsReturnsAscendingRecords) {
    respond(200, kThreeBars);

    auto bars = provider->fetch_bars("AAPL", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_LT(bars[0].timestamp, bars[1].timestamp);
    EXPECT_LT(bars[1].timestamp, bars[2].timestamp);
    for (const auto& b : bars) {
        EXPECT_EQ(b.symbol, "AAPL");
        EXPECT_EQ(b.provider, "alpaca");
        EXPECT_GE(b.high, b.low);
    }
    EXPECT_EQ(bars[0].open, Decimal::parse("187.15"));
    EXPECT_EQ(bars[0].low, Decimal::parse("183.885"));
    EXPECT_EQ(bars[0].close, Decimal::parse("185.64"));
    EXPECT_EQ(bars[0].volume, 82488674);
    ASSERT_TRUE(bars[0].vwap.has_value());
    EXPECT_EQ(*bars[0].vwap, Decimal::parse("185.817"));
    EXPECT_EQ(bars[0].trade_count, 1009074);

    EXPECT_TRUE(log->contains(LogLevel::Info, "Fetched 3 bars for AAPL"));
}

TEST_F(AlpacaRestTest, FetchBarsSendsOneAuthenticatedRequest) {
    respond(200, kThreeBars);

    (void)provider->fetch_bars("aapl", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);

    auto reqs = http->snapshot();
    ASSERT_EQ(reqs.size(), 1u);
    const auto& r = reqs[0];
    EXPECT_EQ(r.url, std::string(kBase) + "/v2/stocks/AAPL/bars");
    EXPECT_EQ(r.param("start"), "2024-01-01T00:00:00Z");
    EXPECT_EQ(r.param("end"), "2024-01-05T00:00:00Z");
    EXPECT_EQ(r.param("timeframe"), "1Day");
    EXPECT_EQ(r.param("adjustment"), "all");
    EXPECT_EQ(r.param("limit"), "10000");
    EXPECT_EQ(r.param("feed"), "iex");
    EXPECT_EQ(r.header("APCA-API-KEY-ID"), "key-id");
    EXPECT_EQ(r.header("APCA-API-SECRET-KEY"), "secret-key");
}

TEST_F(AlpacaRestTest, FetchBarsSortsAndDropsOutOfRange) {
    respond(200, R"({"bars":[
        {"t":"2024-01-04T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":10},
        {"t":"2024-01-02T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":10},
        {"t":"2024-02-01T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":10}
    ],"symbol":"AAPL","next_page_token":null})");

    auto bars = provider->fetch_bars("AAPL", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(TimeCodec::to_date(bars[0].timestamp), "2024-01-02");
    EXPECT_EQ(TimeCodec::to_date(bars[1].timestamp), "2024-01-04");
    EXPECT_TRUE(log->contains(LogLevel::Warn, "outside the requested range"));
}

TEST_F(AlpacaRestTest, NullBarsIsAnEmptyResult) {
    respond(200, R"({"bars":null,"symbol":"AAPL","next_page_token":null})");

    auto bars = provider->fetch_bars("AAPL", at("2024-01-06"), at("2024-01-07"), Timeframe::Day1);

    EXPECT_TRUE(bars.empty());
    EXPECT_TRUE(log->contains(LogLevel::Info, "Fetched 0 bars for AAPL"));
}

TEST_F(AlpacaRestTest, MalformedBarIsSkippedWithWarning) {
    respond(200, R"({"bars":[
        {"t":"2024-01-02T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":10},
        {"t":"2024-01-03T05:00:00Z","o":1,"h":2,"c":2,"v":10},
        {"t":"2024-01-04T05:00:00Z","o":1,"h":0.5,"l":1,"c":2,"v":10}
    ],"symbol":"AAPL","next_page_token":null})");

    auto bars = provider->fetch_bars("AAPL", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);

    ASSERT_EQ(bars.size(), 1u);
    EXPECT_TRUE(log->contains(LogLevel::Warn, "skipped 2 malformed bars"));
}

TEST_F(AlpacaRestTest, LargeVolumesAreReadExactly) {
    respond(200, R"({"bars":[
        {"t":"2024-01-02T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":150000000000,"n":120000000001},
        {"t":"2024-01-03T05:00:00Z","o":1,"h":2,"l":1,"c":2,"v":12.75}
    ],"symbol":"SPY","next_page_token":null})");

    auto bars = provider->fetch_bars("SPY", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].volume, 150000000000);
    EXPECT_EQ(bars[0].trade_count, 120000000001);
    EXPECT_EQ(bars[1].volume, 12);
}

TEST_F(AlpacaRestTest, StartAfterEndIsRejectedWithoutIo) {
    respond(200, kThreeBars);
    EXPECT_THROW(provider->fetch_bars("AAPL", at("2024-01-05"), at("2024-01-01"), Timeframe::Day1),
                 std::invalid_argument);
    EXPECT_TRUE(http->snapshot().empty());
}

TEST_F(AlpacaRestTest, HttpErrorBecomesTransportFailure) {
    respond(500, R"({"message":"internal"})");
    try {
        (void)provider->fetch_bars("AAPL", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1);
        FAIL() << "expected TransportFailure";
    } catch (const TransportFailure& e) {
        EXPECT_EQ(e.kind(), ProviderErrc::TransportFailure);
        EXPECT_EQ(e.vendor(), "alpaca");
        EXPECT_EQ(e.operation(), "fetch_bars");
        EXPECT_EQ(e.symbol(), "AAPL");
        EXPECT_EQ(e.http_status(), 500);
    }
}

TEST_F(AlpacaRestTest, NetworkErrorBecomesTransportFailure) {
    {
        std::lock_guard<std::mutex> lk(http->m);
        http->handler = [](const RecordedRequest&) -> HttpResponse {
            throw std::runtime_error("curl: Couldn't resolve host name");
        };
    }
    try {
        (void)provider->fetch_latest_quote("AAPL");
        FAIL() << "expected TransportFailure";
    } catch (const TransportFailure& e) {
        EXPECT_EQ(e.operation(), "fetch_latest_quote");
        EXPECT_FALSE(e.http_status().has_value());
        EXPECT_NE(std::string(e.what()).find("resolve host"), std::string::npos);
    }
}

TEST_F(AlpacaRestTest, RejectedKeyIsAuthenticationFailure) {
    respond(401, R"({"message":"unauthorized."})");
    EXPECT_THROW((void)provider->fetch_latest_quote("AAPL"), AuthenticationFailed);
}

TEST_F(AlpacaRestTest, MalformedBodyIsTransportFailure) {
    respond(200, "<html>gateway</html>");
    EXPECT_THROW((void)provider->fetch_bars("AAPL", at("2024-01-01"), at("2024-01-05"), Timeframe::Day1),
                 TransportFailure);
}

TEST_F(AlpacaRestTest, LatestQuoteIsMidpointWithZeroRange) {
    respond(200, R"({"symbol":"AAPL","quote":{"t":"2024-01-02T20:59:59.123Z","ax":"V","ap":185.70,"as":2,
                    "bx":"V","bp":185.60,"bs":3,"c":["R"],"z":"C"}})");

    const MarketData q = provider->fetch_latest_quote("AAPL");

    EXPECT_EQ(q.symbol, "AAPL");
    EXPECT_EQ(q.close, Decimal::parse("185.65"));
    EXPECT_TRUE(q.open.is_zero());
    EXPECT_TRUE(q.high.is_zero());
    EXPECT_TRUE(q.low.is_zero());
    EXPECT_EQ(q.volume, 0);
    EXPECT_EQ(q.provider, "alpaca");
    EXPECT_EQ(TimeCodec::to_iso8601(q.timestamp), "2024-01-02T20:59:59.123Z");

    auto reqs = http->snapshot();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].url, std::string(kBase) + "/v2/stocks/AAPL/quotes/latest");
}

TEST_F(AlpacaRestTest, OptionsNotFoundIsEmptyWithWarning) {
    respond(404, R"({"message":"not found"})");

    auto chain = provider->fetch_options_chain("AAPL", std::nullopt);

    EXPECT_TRUE(chain.empty());
    EXPECT_TRUE(log->contains(LogLevel::Warn, "Options data not available for AAPL"));
}

TEST_F(AlpacaRestTest, OptionsServerErrorIsTransportFailure) {
    respond(500, "{}");
    EXPECT_THROW((void)provider->fetch_options_chain("AAPL", std::nullopt), TransportFailure);
}

TEST_F(AlpacaRestTest, OptionsSnapshotsAreDecoded) {
    respond(200, R"({"snapshots":{
        "AAPL240119P00145000":{
            "latestQuote":{"t":"2024-01-10T15:00:00Z","bp":0.5,"ap":0.55,"bs":10,"as":12},
            "latestTrade":{"t":"2024-01-10T14:59:00Z","p":0.52,"s":1}
        },
        "AAPL240119C00150000":{
            "latestQuote":{"t":"2024-01-10T15:00:00Z","bp":1.2,"ap":1.3},
            "latestTrade":{"t":"2024-01-10T15:00:01Z","p":1.25},
            "dailyBar":{"t":"2024-01-10T05:00:00Z","o":1,"h":1.4,"l":1,"c":1.25,"v":734},
            "impliedVolatility":0.2531,
            "greeks":{"delta":0.52,"gamma":0.04,"theta":-0.09,"vega":0.11,"rho":0.02}
        }
    },"next_page_token":null})");

    const Timestamp expiry = at("2024-01-19");
    auto chain = provider->fetch_options_chain("AAPL", expiry);

    ASSERT_EQ(chain.size(), 2u);
    auto req = http->snapshot().at(0);
    EXPECT_EQ(req.url, std::string(kBase) + "/v1beta1/options/snapshots/AAPL");
    EXPECT_EQ(req.param("expiration_date"), "2024-01-19");

    // ordered by expiration, then strike
    const OptionsQuote& put = chain[0];
    EXPECT_EQ(put.contract, "AAPL240119P00145000");
    EXPECT_EQ(put.type, OptionType::Put);
    EXPECT_EQ(put.strike, Decimal::from_int(145));
    EXPECT_FALSE(put.greeks.has_value());
    EXPECT_FALSE(put.implied_volatility.has_value());

    const OptionsQuote& call = chain[1];
    EXPECT_EQ(call.underlying, "AAPL");
    EXPECT_EQ(call.type, OptionType::Call);
    EXPECT_EQ(call.strike, Decimal::from_int(150));
    EXPECT_EQ(call.expiration, expiry);
    EXPECT_EQ(call.bid, Decimal::parse("1.2"));
    EXPECT_EQ(call.ask, Decimal::parse("1.3"));
    EXPECT_EQ(call.last, Decimal::parse("1.25"));
    EXPECT_EQ(call.volume, 734);
    EXPECT_EQ(TimeCodec::to_iso8601(call.timestamp), "2024-01-10T15:00:01Z");
    ASSERT_TRUE(call.implied_volatility.has_value());
    EXPECT_DOUBLE_EQ(*call.implied_volatility, 0.2531);
    ASSERT_TRUE(call.greeks.has_value());
    EXPECT_DOUBLE_EQ(*call.greeks->delta, 0.52);
    EXPECT_DOUBLE_EQ(*call.greeks->theta, -0.09);
}

TEST_F(AlpacaRestTest, OptionsFollowPageTokens) {
    {
        std::lock_guard<std::mutex> lk(http->m);
        http->handler = [](const RecordedRequest& r) -> HttpResponse {
            if (!r.param("page_token")) {
                return {200, R"({"snapshots":{"AAPL240119C00150000":{"latestQuote":{"t":"2024-01-10T15:00:00Z","bp":1.2,"ap":1.3}}},
                                 "next_page_token":"page-2"})"};
            }
            return {200, R"({"snapshots":{"AAPL240119C00155000":{"latestQuote":{"t":"2024-01-10T15:00:00Z","bp":0.8,"ap":0.9}}},
                             "next_page_token":null})"};
        };
    }

    auto chain = provider->fetch_options_chain("AAPL", std::nullopt);

    ASSERT_EQ(chain.size(), 2u);
    auto reqs = http->snapshot();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[1].param("page_token"), "page-2");
}

TEST_F(AlpacaRestTest, MissingLaterOptionsPageIsTransportFailure) {
    {
        std::lock_guard<std::mutex> lk(http->m);
        http->handler = [](const RecordedRequest& r) -> HttpResponse {
            if (!r.param("page_token")) {
                return {200, R"({"snapshots":{"AAPL240119C00150000":{"latestQuote":{"t":"2024-01-10T15:00:00Z","bp":1.2,"ap":1.3}}},
                                 "next_page_token":"page-2"})"};
            }
            return {404, R"({"message":"not found"})"};
        };
    }

    try {
        (void)provider->fetch_options_chain("AAPL", std::nullopt);
        FAIL() << "expected TransportFailure";
    } catch (const TransportFailure& e) {
        EXPECT_EQ(e.operation(), "fetch_options_chain");
        EXPECT_EQ(e.http_status(), 404);
    }
    EXPECT_EQ(http->snapshot().size(), 2u);
    EXPECT_FALSE(log->contains(LogLevel::Warn, "Options data not available"));
}

TEST_F(AlpacaRestTest, CallsBeforeOpenAreRejected) {
    provider->close();
    EXPECT_FALSE(provider->is_open());
    EXPECT_THROW((void)provider->fetch_latest_quote("AAPL"), std::logic_error);
}

TEST_F(AlpacaRestTest, SessionClosesProviderWhenCallerThrows) {
    provider->close();
    respond(200, kThreeBars);
    try {
        ProviderSession session(*provider);
        EXPECT_TRUE(provider->is_open());
        throw std::runtime_error("caller failure");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(provider->is_open());
}

TEST_F(AlpacaRestTest, AdvertisesAllFourCapabilities) {
    EXPECT_TRUE(provider->supports(Capability::HistoricalBars));
    EXPECT_TRUE(provider->supports(Capability::LatestQuote));
    EXPECT_TRUE(provider->supports(Capability::TradeStream));
    EXPECT_TRUE(provider->supports(Capability::OptionsChain));
}
