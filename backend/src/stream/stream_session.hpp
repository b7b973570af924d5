#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "stream_codec.hpp"
#include "transport/ws_connection.hpp"
#include "util/logger.hpp"

enum class StreamState : std::uint8_t
{
    Disconnected,
    Connecting,
    Authenticating,
    Subscribing,
    Streaming,
    Closed, // cancelled by the caller
    Failed  // transport error, rejected credential or rejected subscription
};

const char *to_string(StreamState state);

using TradeSink = std::function<void(const MarketData &)>;

// Owns the WebSocket for one trade subscription and drives
//   Disconnected -> Connecting -> Authenticating -> Subscribing -> Streaming -> Closed
// with Failed reachable from every non-terminal state. Single use.
class StreamSession
{
public:
    struct Options
    {
        // Upper bound on how long a cancellation request goes unnoticed.
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(250)};
        // Limit on connecting and on each reply while authenticating and subscribing.
        std::chrono::milliseconds handshake_timeout{std::chrono::seconds(10)};
    };

    using StateObserver = std::function<void(StreamState)>;

    StreamSession(std::string vendor,
                  WsEndpoint endpoint,
                  WsConnector connector,
                  IStreamCodec &codec,
                  std::shared_ptr<ILogger> logger,
                  Options opts);
    ~StreamSession();

    StreamSession(const StreamSession &) = delete;
    StreamSession &operator=(const StreamSession &) = delete;

    // Blocks until `stop` is requested (returns normally, state Closed) or the
    // session fails (throws, state Failed). Exceptions thrown by `sink` are
    // rethrown unchanged after teardown.
    void run(const ProviderCredential &credential,
             const std::vector<std::string> &symbols,
             const TradeSink &sink,
             std::stop_token stop);

    StreamState state() const noexcept { return state_.load(std::memory_order_acquire); }
    std::uint64_t trades_delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }

    // Called on every transition, on the thread running run().
    void on_state_change(StateObserver observer) { observer_ = std::move(observer); }

private:
    void transition(StreamState next);
    // false when cancelled before the expected reply arrived
    bool await_control(ControlKind expected,
                       const std::string &symbols_label,
                       std::stop_token stop,
                       std::vector<StreamEvent> &leftover);
    void stream_loop(const TradeSink &sink,
                     std::stop_token stop,
                     std::vector<StreamEvent> &pending,
                     std::exception_ptr &sink_error);
    void teardown() noexcept;

    std::string vendor_;
    WsEndpoint endpoint_;
    WsConnector connector_;
    IStreamCodec &codec_;
    std::shared_ptr<ILogger> log_;
    Options opts_;
    std::string tag_;

    std::unique_ptr<IWsConnection> ws_;
    std::atomic<StreamState> state_{StreamState::Disconnected};
    std::atomic<std::uint64_t> delivered_{0};
    StateObserver observer_;
};
