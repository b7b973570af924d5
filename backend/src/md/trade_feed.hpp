#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "md_types.hpp"
#include "providers/market_data_provider.hpp"
#include "util/logger.hpp"
#include "util/spsc_ring.hpp"

// Policy when the queue is full
enum class Backpressure {
    Block,     // the stream thread waits for the consumer
    DropNewest // the incoming trade is discarded and counted
};

// Runs provider.stream_trades() on its own thread and hands the trades to a
// single consumer through an SPSC ring:
//  - producer: the stream thread (the provider's sink only enqueues)
//  - consumer: whoever calls try_pop()
// The provider must stay open for the lifetime of the feed.
template <std::size_t QueuePow2 = 4096>
class TradeFeed {
public:
    TradeFeed(IMarketDataProvider& provider,
              std::vector<std::string> symbols,
              Backpressure bp = Backpressure::Block,
              std::shared_ptr<ILogger> logger = nullptr)
    : provider_(provider)
    , symbols_(std::move(symbols))
    , backpressure_(bp)
    , log_(logger ? std::move(logger) : default_logger()) {}

    ~TradeFeed() {
        halt();
        if (error_) log_->warn("feed", "stream error discarded at shutdown");
    }

    TradeFeed(const TradeFeed&) = delete;
    TradeFeed& operator=(const TradeFeed&) = delete;

    void start() {
        if (thread_.joinable()) throw std::logic_error("trade feed already started");
        finished_.store(false, std::memory_order_relaxed);
        thread_ = std::jthread([this](std::stop_token st) { produce(st); });
    }

    // Cancels the stream, joins the thread and rethrows the stream's failure, if any.
    void stop() {
        halt();
        if (error_) {
            auto err = std::exchange(error_, nullptr);
            std::rethrow_exception(err);
        }
    }

    // Consumer side
    bool try_pop(MarketData& out) { return queue_.try_pop(out); }

    // False once the stream has returned or failed.
    bool running() const { return thread_.joinable() && !finished_.load(std::memory_order_acquire); }
    std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t enqueued() const { return enqueued_.load(std::memory_order_relaxed); }

private:
    void halt() {
        if (thread_.joinable()) {
            thread_.request_stop();
            thread_.join();
        }
    }

    void produce(std::stop_token st) {
        try {
            provider_.stream_trades(symbols_, [this, &st](const MarketData& md) { enqueue(md, st); }, st);
        } catch (...) {
            error_ = std::current_exception(); // handed to stop()
            log_->error("feed", "trade stream ended with an error");
        }
        finished_.store(true, std::memory_order_release);
    }

    void enqueue(const MarketData& md, const std::stop_token& st) {
        MarketData copy(md);
        while (!queue_.try_push(std::move(copy))) {
            if (backpressure_ == Backpressure::DropNewest) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            if (st.stop_requested()) return;
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        enqueued_.fetch_add(1, std::memory_order_relaxed);
    }

    IMarketDataProvider& provider_;
    std::vector<std::string> symbols_;
    Backpressure backpressure_;
    std::shared_ptr<ILogger> log_;

    SpscRing<MarketData, QueuePow2> queue_;
    std::jthread thread_;
    std::atomic<bool> finished_{false};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> enqueued_{0};
    std::exception_ptr error_;
};
