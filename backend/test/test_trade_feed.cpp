#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "md/trade_feed.hpp"
#include "util/logger.hpp"

using namespace std::chrono_literals;

namespace {

// Emits `count` trades, then either fails or waits for cancellation.
class ScriptedStreamProvider final : public IMarketDataProvider {
public:
    explicit ScriptedStreamProvider(int count, bool fail_after = false)
        : count_(count), fail_after_(fail_after) {}

    std::string name() const override { return "scripted"; }
    CapabilitySet capabilities() const override { return {Capability::TradeStream}; }
    void open() override {}
    void close() noexcept override {}
    bool is_open() const override { return true; }

    std::vector<MarketData> fetch_bars(const std::string&, Timestamp, Timestamp, Timeframe) override {
        throw std::logic_error("not scripted");
    }
    MarketData fetch_latest_quote(const std::string&) override { throw std::logic_error("not scripted"); }
    std::vector<OptionsQuote> fetch_options_chain(const std::string&, std::optional<Timestamp>) override {
        throw std::logic_error("not scripted");
    }

    void stream_trades(const std::vector<std::string>& symbols, const TradeSink& sink,
                       std::stop_token stop) override {
        for (int i = 0; i < count_ && !stop.stop_requested(); ++i) {
            MarketData md;
            md.symbol = symbols.at(static_cast<std::size_t>(i) % symbols.size());
            md.close = Decimal::from_int(i);
            md.volume = 1;
            md.provider = name();
            sink(md);
        }
        emitted_.store(true);
        if (fail_after_) throw std::runtime_error("socket reset");
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
    }

    bool emitted() const { return emitted_.load(); }

private:
    int count_;
    bool fail_after_;
    std::atomic<bool> emitted_{false};
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST(TradeFeedTest, BlockingFeedDeliversEverythingInOrder) {
    ScriptedStreamProvider provider(100);
    TradeFeed<8> feed(provider, {"AAPL", "TSLA"}, Backpressure::Block, std::make_shared<NullLogger>());
    feed.start();

    std::vector<MarketData> got;
    MarketData md;
    ASSERT_TRUE(eventually([&] {
        while (feed.try_pop(md)) got.push_back(md);
        return got.size() == 100;
    }));
    feed.stop();

    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(got[static_cast<std::size_t>(i)].close, Decimal::from_int(i));
    }
    EXPECT_EQ(got[0].symbol, "AAPL");
    EXPECT_EQ(got[1].symbol, "TSLA");
    EXPECT_EQ(feed.dropped(), 0u);
    EXPECT_FALSE(feed.running());
}

TEST(TradeFeedTest, DropNewestCountsOverflow) {
    ScriptedStreamProvider provider(10);
    TradeFeed<4> feed(provider, {"AAPL"}, Backpressure::DropNewest, std::make_shared<NullLogger>());
    feed.start();
    ASSERT_TRUE(eventually([&] { return provider.emitted(); }));

    // ring of 4 slots holds 3
    EXPECT_EQ(feed.dropped(), 7u);
    MarketData md;
    std::vector<MarketData> got;
    while (feed.try_pop(md)) got.push_back(md);
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0].close, Decimal::from_int(0));
    EXPECT_EQ(got[2].close, Decimal::from_int(2));
    feed.stop();
}

TEST(TradeFeedTest, StopRethrowsStreamFailure) {
    ScriptedStreamProvider provider(2, true);
    TradeFeed<> feed(provider, {"AAPL"}, Backpressure::Block, std::make_shared<NullLogger>());
    feed.start();
    ASSERT_TRUE(eventually([&] { return !feed.running(); }));

    EXPECT_THROW(feed.stop(), std::runtime_error);
    // the failure is reported once
    EXPECT_NO_THROW(feed.stop());

    MarketData md;
    int n = 0;
    while (feed.try_pop(md)) ++n;
    EXPECT_EQ(n, 2);
}

TEST(TradeFeedTest, StartTwiceIsALogicError) {
    ScriptedStreamProvider provider(0);
    TradeFeed<> feed(provider, {"AAPL"}, Backpressure::Block, std::make_shared<NullLogger>());
    feed.start();
    EXPECT_THROW(feed.start(), std::logic_error);
    feed.stop();
}
