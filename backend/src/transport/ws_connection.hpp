#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

// Parsed "wss://host[:port]/path"
struct WsEndpoint {
    std::string host;
    std::string port = "443";
    std::string path = "/";

    // Only secure URLs are accepted. Throws std::invalid_argument.
    static WsEndpoint parse(const std::string& url);
};

// Raised by receive() when the peer closed the connection (close frame or EOF).
class WsClosed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One text-frame WebSocket connection. Used from a single thread.
struct IWsConnection {
    virtual ~IWsConnection() = default;

    // TCP connect, TLS and WebSocket handshakes, all within `timeout`.
    // Returns false when `stop` was requested before the connection was up.
    // Throws on failure or timeout.
    virtual bool connect(std::chrono::milliseconds timeout, const std::stop_token& stop) = 0;
    virtual void send(const std::string& text) = 0;
    // Waits at most `timeout` for the next frame; std::nullopt on timeout.
    // Throws WsClosed on orderly close and std::runtime_error on transport errors.
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;
    // Drops the socket without a closing handshake. Safe to call more than once.
    virtual void close() noexcept = 0;
};

using WsConnector = std::function<std::unique_ptr<IWsConnection>(const WsEndpoint&)>;

std::unique_ptr<IWsConnection> make_beast_ws_connection(const WsEndpoint& endpoint);
