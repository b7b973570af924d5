#include "stream_session.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "md/time_codec.hpp"
#include "providers/provider_error.hpp"

namespace {

std::string join(const std::vector<std::string> &items, const char *sep)
{
    std::string out;
    for (const auto &s : items)
    {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

std::string describe(const ControlMessage &msg)
{
    std::string out = msg.detail.empty() ? std::string(to_string(msg.kind)) : msg.detail;
    if (msg.code != 0) out += " (code " + std::to_string(msg.code) + ")";
    return out;
}

} // namespace

const char *to_string(StreamState state)
{
    switch (state)
    {
        case StreamState::Disconnected:   return "disconnected";
        case StreamState::Connecting:     return "connecting";
        case StreamState::Authenticating: return "authenticating";
        case StreamState::Subscribing:    return "subscribing";
        case StreamState::Streaming:      return "streaming";
        case StreamState::Closed:         return "closed";
        case StreamState::Failed:         return "failed";
    }
    return "unknown";
}

StreamSession::StreamSession(std::string vendor,
                             WsEndpoint endpoint,
                             WsConnector connector,
                             IStreamCodec &codec,
                             std::shared_ptr<ILogger> logger,
                             Options opts)
    : vendor_(std::move(vendor))
    , endpoint_(std::move(endpoint))
    , connector_(std::move(connector))
    , codec_(codec)
    , log_(logger ? std::move(logger) : default_logger())
    , opts_(opts)
    , tag_(vendor_ + "-ws")
{
    if (!connector_) throw std::invalid_argument("StreamSession needs a WebSocket connector");
}

StreamSession::~StreamSession() { teardown(); }

void StreamSession::transition(StreamState next)
{
    const StreamState prev = state_.exchange(next, std::memory_order_acq_rel);
    log_->debug(tag_, std::string(to_string(prev)) + " -> " + to_string(next));
    if (observer_) observer_(next);
}

void StreamSession::teardown() noexcept
{
    if (ws_)
    {
        ws_->close();
        ws_.reset();
    }
}

void StreamSession::run(const ProviderCredential &credential,
                        const std::vector<std::string> &symbols,
                        const TradeSink &sink,
                        std::stop_token stop)
{
    if (state() != StreamState::Disconnected)
        throw std::logic_error("stream session is single-use");
    if (symbols.empty())
        throw std::invalid_argument("stream_trades needs at least one symbol");

    const std::string label = join(symbols, ",");
    std::vector<StreamEvent> pending;
    std::exception_ptr sink_error;

    try
    {
        transition(StreamState::Connecting);
        ws_ = connector_(endpoint_);
        if (!ws_) throw std::runtime_error("connector returned no connection");
        const bool connected = ws_->connect(opts_.handshake_timeout, stop);
        if (connected) log_->info(tag_, "connected to " + endpoint_.host + endpoint_.path);

        if (connected && !stop.stop_requested())
        {
            transition(StreamState::Authenticating);
            ws_->send(codec_.auth_message(credential));
            if (await_control(ControlKind::Authenticated, label, stop, pending))
            {
                log_->info(tag_, "authenticated");
                transition(StreamState::Subscribing);
                ws_->send(codec_.subscribe_message(symbols));
                if (await_control(ControlKind::Subscribed, label, stop, pending))
                {
                    log_->info(tag_, "subscribed to trades for " + label);
                    transition(StreamState::Streaming);
                    stream_loop(sink, stop, pending, sink_error);
                }
            }
        }
    }
    catch (const ProviderError &e)
    {
        log_->error(tag_, e.what());
        teardown();
        transition(StreamState::Failed);
        throw;
    }
    catch (const std::exception &e)
    {
        log_->error(tag_, e.what());
        teardown();
        transition(StreamState::Failed);
        throw TransportFailure(vendor_, "stream_trades", label, e.what());
    }

    teardown();
    if (sink_error)
    {
        transition(StreamState::Failed);
        std::rethrow_exception(sink_error);
    }
    log_->info(tag_, "stream for " + label + " cancelled after " + std::to_string(trades_delivered()) + " trades");
    transition(StreamState::Closed);
}

bool StreamSession::await_control(ControlKind expected,
                                  const std::string &symbols_label,
                                  std::stop_token stop,
                                  std::vector<StreamEvent> &leftover)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + opts_.handshake_timeout;
    std::vector<StreamEvent> events;

    while (!stop.stop_requested())
    {
        const auto now = clock::now();
        if (now >= deadline)
        {
            throw TransportFailure(vendor_, "stream_trades", symbols_label,
                                   std::string("timed out waiting for ") + to_string(expected) + " reply");
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto frame = ws_->receive(std::min(opts_.poll_interval, remaining));
        if (!frame) continue;

        events.clear();
        codec_.decode(*frame, events); // handshake frames must parse

        for (auto it = events.begin(); it != events.end(); ++it)
        {
            const auto *ctl = std::get_if<ControlMessage>(&*it);
            if (!ctl)
            {
                log_->debug(tag_, "trade before subscription acknowledgment ignored");
                continue;
            }

            if (ctl->kind == expected)
            {
                // Events sharing the acknowledgment frame belong to the stream
                leftover.assign(std::make_move_iterator(std::next(it)), std::make_move_iterator(events.end()));
                return true;
            }

            switch (ctl->kind)
            {
                case ControlKind::Connected:
                    log_->debug(tag_, "server greeting: " + describe(*ctl));
                    break;
                case ControlKind::AuthRejected:
                    throw AuthenticationFailed(vendor_, "stream_trades", symbols_label, describe(*ctl));
                case ControlKind::Error:
                    if (expected == ControlKind::Authenticated)
                        throw AuthenticationFailed(vendor_, "stream_trades", symbols_label, describe(*ctl));
                    throw TransportFailure(vendor_, "stream_trades", symbols_label,
                                           "subscription rejected: " + describe(*ctl));
                default:
                    log_->debug(tag_, "ignoring " + describe(*ctl) + " while waiting for " + to_string(expected));
                    break;
            }
        }
    }
    return false;
}

void StreamSession::stream_loop(const TradeSink &sink,
                                std::stop_token stop,
                                std::vector<StreamEvent> &pending,
                                std::exception_ptr &sink_error)
{
    std::vector<StreamEvent> events = std::move(pending);
    std::unordered_map<std::string, Timestamp> last_seen;

    for (;;)
    {
        for (const auto &ev : events)
        {
            if (stop.stop_requested()) return;

            if (const auto *trade = std::get_if<MarketData>(&ev))
            {
                auto [it, inserted] = last_seen.try_emplace(trade->symbol, trade->timestamp);
                if (!inserted)
                {
                    if (trade->timestamp < it->second)
                        log_->warn(tag_, trade->symbol + " trade timestamp " + TimeCodec::to_iso8601(trade->timestamp) +
                                             " earlier than " + TimeCodec::to_iso8601(it->second));
                    else
                        it->second = trade->timestamp;
                }

                try
                {
                    sink(*trade);
                }
                catch (...)
                {
                    sink_error = std::current_exception();
                    return;
                }
                delivered_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            const auto &ctl = std::get<ControlMessage>(ev);
            if (ctl.kind == ControlKind::Error || ctl.kind == ControlKind::AuthRejected)
                log_->warn(tag_, "vendor error while streaming: " + describe(ctl));
            else
                log_->debug(tag_, "ignoring " + describe(ctl));
        }

        if (stop.stop_requested()) return;

        events.clear();
        auto frame = ws_->receive(opts_.poll_interval);
        if (!frame) continue;
        try
        {
            codec_.decode(*frame, events);
        }
        catch (const std::exception &e)
        {
            log_->warn(tag_, std::string("dropping malformed frame: ") + e.what());
            events.clear();
        }
    }
}
