#include "ws_connection.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <stop_token>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

WsEndpoint WsEndpoint::parse(const std::string& url)
{
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("websocket url must start with wss://: '" + url + "'");
    }
    WsEndpoint ep;
    std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ep.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    const auto colon = authority.find(':');
    if (colon != std::string::npos) {
        ep.port = authority.substr(colon + 1);
        authority.resize(colon);
        if (ep.port.empty()) throw std::invalid_argument("websocket url has an empty port: '" + url + "'");
    }
    if (authority.empty()) throw std::invalid_argument("websocket url has no host: '" + url + "'");
    ep.host = authority;
    return ep;
}

namespace {

// NOTE: PIMPL keeps Boost headers out of every file that includes ws_connection.hpp
class BeastWsConnection final : public IWsConnection
{
public:
    explicit BeastWsConnection(WsEndpoint endpoint);
    ~BeastWsConnection() override;
    BeastWsConnection(const BeastWsConnection &) = delete;
    BeastWsConnection &operator=(const BeastWsConnection &) = delete;

    bool connect(std::chrono::milliseconds timeout, const std::stop_token &stop) override;
    void send(const std::string &text) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

struct BeastWsConnection::Impl
{
    WsEndpoint ep;

    // Longest stretch connect() runs the io_context without checking for a stop
    static constexpr std::chrono::milliseconds kConnectSlice{50};

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<websocket::stream<beast::ssl_stream<tcp::socket>>> ws;

    // One outstanding async_read survives across receive() timeouts.
    beast::flat_buffer buffer;
    bool read_pending = false;
    bool read_done = false;
    beast::error_code read_ec;

    explicit Impl(WsEndpoint endpoint) : ep(std::move(endpoint))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    // Runs the io_context until `done`, giving up on stop or at the deadline.
    // Abandoned operations are cancelled and drained before returning.
    bool drive(const bool &done,
               std::chrono::steady_clock::time_point deadline,
               const std::stop_token &stop,
               tcp::resolver &resolver,
               const char *step)
    {
        while (!done) {
            const auto now = std::chrono::steady_clock::now();
            if (stop.stop_requested() || now >= deadline) {
                resolver.cancel();
                beast::error_code ec;
                beast::get_lowest_layer(*ws).close(ec);
                ioc.restart();
                ioc.run();
                ws.reset();
                if (stop.stop_requested()) return false;
                throw std::runtime_error(std::string(step) + " to " + ep.host + " timed out");
            }
            if (ioc.stopped()) ioc.restart();
            ioc.run_for(std::min<std::chrono::steady_clock::duration>(kConnectSlice, deadline - now));
        }
        return true;
    }

    bool connect(std::chrono::milliseconds timeout, const std::stop_token &stop)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        tcp::resolver resolver{ioc};
        ws = std::make_unique<websocket::stream<beast::ssl_stream<tcp::socket>>>(ioc, ssl_ctx);

        bool done = false;
        beast::error_code ec;
        auto finish = [&](const char *step) {
            if (ec) throw beast::system_error{ec, step};
            done = false;
        };

        // DNS
        tcp::resolver::results_type results;
        resolver.async_resolve(ep.host, ep.port,
            [&](beast::error_code e, tcp::resolver::results_type r) {
                ec = e;
                results = std::move(r);
                done = true;
            });
        if (!drive(done, deadline, stop, resolver, "resolve")) return false;
        finish("resolve");

        // TCP connect
        net::async_connect(beast::get_lowest_layer(*ws), results,
            [&](beast::error_code e, const tcp::endpoint &) {
                ec = e;
                done = true;
            });
        if (!drive(done, deadline, stop, resolver, "tcp connect")) return false;
        finish("tcp connect");

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), ep.host.c_str())) {
            throw beast::system_error{
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "SNI set failed"
            };
        }

        // SSL handshake
        ws->next_layer().async_handshake(net::ssl::stream_base::client,
            [&](beast::error_code e) {
                ec = e;
                done = true;
            });
        if (!drive(done, deadline, stop, resolver, "tls handshake")) return false;
        finish("tls handshake");

        // WS handshake
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req){
            req.set(http::field::user_agent, std::string("md-ingest-ws/1.0"));
        }));
        ws->async_handshake(ep.host, ep.path,
            [&](beast::error_code e) {
                ec = e;
                done = true;
            });
        if (!drive(done, deadline, stop, resolver, "websocket handshake")) return false;
        finish("websocket handshake");

        // Idle pings only once the connection is up; connect() is bounded by the deadline
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->text(true);
        return true;
    }

    void send(const std::string &text)
    {
        if (!ws) throw std::logic_error("websocket send before connect");
        ws->write(net::buffer(text));
    }

    std::optional<std::string> receive(std::chrono::milliseconds timeout)
    {
        if (!ws) throw std::logic_error("websocket receive before connect");

        if (!read_pending) {
            buffer.clear();
            read_done = false;
            read_pending = true;
            ws->async_read(buffer, [this](beast::error_code ec, std::size_t) {
                read_ec = ec;
                read_done = true;
            });
        }

        if (ioc.stopped()) ioc.restart();
        ioc.run_for(timeout);
        if (!read_done) return std::nullopt;

        read_pending = false;
        if (read_ec) {
            // Orderly remote shutdown
            if (read_ec == websocket::error::closed ||
                read_ec == net::error::eof ||
                read_ec == net::ssl::error::stream_truncated) {
                throw WsClosed("connection closed by peer: " + read_ec.message());
            }
            throw beast::system_error{read_ec};
        }
        return beast::buffers_to_string(buffer.cdata());
    }

    void close() noexcept
    {
        if (!ws) return;
        beast::error_code ec;
        beast::get_lowest_layer(*ws).shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(*ws).close(ec);
        // Let a cancelled async_read complete before the stream is destroyed
        if (read_pending) {
            try {
                if (ioc.stopped()) ioc.restart();
                ioc.poll();
            } catch (const std::exception &) {
                // the socket is already gone; nothing left to release
            }
            read_pending = false;
        }
        ws.reset();
    }
};

BeastWsConnection::BeastWsConnection(WsEndpoint endpoint) : impl_(std::make_unique<Impl>(std::move(endpoint))) {}
BeastWsConnection::~BeastWsConnection() { impl_->close(); }

// The outer class methods just forward to the implementation
bool BeastWsConnection::connect(std::chrono::milliseconds timeout, const std::stop_token &stop)
{
    return impl_->connect(timeout, stop);
}
void BeastWsConnection::send(const std::string &text) { impl_->send(text); }
std::optional<std::string> BeastWsConnection::receive(std::chrono::milliseconds timeout) { return impl_->receive(timeout); }
void BeastWsConnection::close() noexcept { impl_->close(); }

} // namespace

std::unique_ptr<IWsConnection> make_beast_ws_connection(const WsEndpoint &endpoint)
{
    return std::make_unique<BeastWsConnection>(endpoint);
}
