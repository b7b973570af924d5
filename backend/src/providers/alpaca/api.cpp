#include "api.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "md/symbol_codec.hpp"
#include "md/time_codec.hpp"
#include "providers/provider_error.hpp"
#include "rest_parser.hpp"
#include "stream_codec.hpp"

namespace {

constexpr const char *kTag = "alpaca-rest";
// Stops a misbehaving server from paging forever.
constexpr int kMaxOptionPages = 100;

std::string snippet(const std::string &body) {
    constexpr std::size_t kMax = 200;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

} // namespace

AlpacaProvider::AlpacaProvider(ProviderCredential credential, ProviderDeps deps)
    : credential_(std::move(credential))
    , deps_(resolve_deps(kName, std::move(deps))) {
    if (!deps_.endpoints->stream_url.empty()) {
        stream_endpoint_ = WsEndpoint::parse(deps_.endpoints->stream_url);
    }
}

AlpacaProvider::~AlpacaProvider() { close(); }

CapabilitySet AlpacaProvider::capabilities() const {
    if (!stream_endpoint_) {
        return {Capability::HistoricalBars, Capability::LatestQuote, Capability::OptionsChain};
    }
    return {Capability::HistoricalBars, Capability::LatestQuote, Capability::TradeStream,
            Capability::OptionsChain};
}

void AlpacaProvider::open() {
    std::lock_guard<std::mutex> lk(m_);
    if (http_) return;
    http_ = std::shared_ptr<IHttpClient>(deps_.make_http());
    if (!http_) throw std::runtime_error("alpaca: HTTP client factory returned nothing");
    closing_ = std::stop_source{};
    deps_.logger->debug(kTag, "session opened");
}

void AlpacaProvider::close() noexcept {
    std::lock_guard<std::mutex> lk(m_);
    if (!http_) return;
    closing_.request_stop();
    // in-flight requests keep their own reference
    http_.reset();
    deps_.logger->debug(kTag, "session closed");
}

bool AlpacaProvider::is_open() const {
    std::lock_guard<std::mutex> lk(m_);
    return static_cast<bool>(http_);
}

std::shared_ptr<IHttpClient> AlpacaProvider::http_for(const char *operation) const {
    std::lock_guard<std::mutex> lk(m_);
    if (!http_) throw std::logic_error(std::string("alpaca: ") + operation + " called before open()");
    return http_;
}

HttpHeaders AlpacaProvider::auth_headers() const {
    return {
        {"APCA-API-KEY-ID", credential_.api_key},
        {"APCA-API-SECRET-KEY", credential_.api_secret.value_or("")},
    };
}

std::string AlpacaProvider::venue_symbol(const char *operation, const std::string &symbol) const {
    std::string v = SymbolCodec::to_venue(kName, symbol);
    if (v.empty()) throw std::invalid_argument(std::string("alpaca: ") + operation + " needs a symbol");
    for (char ch : v) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '.' && ch != '-') {
            throw std::invalid_argument("alpaca: invalid symbol '" + symbol + "'");
        }
    }
    return v;
}

HttpResponse AlpacaProvider::get(const char *operation, const std::string &symbol,
                                 const std::string &url, const QueryParams &query) {
    auto http = http_for(operation);
    HttpResponse resp;
    try {
        resp = http->get(url, query, auth_headers());
    } catch (const std::exception &e) {
        deps_.logger->error(kTag, std::string("Error in ") + operation + " for " + symbol + ": " + e.what());
        throw TransportFailure(kName, operation, symbol, e.what());
    }
    if (resp.status == 401 || resp.status == 403) {
        throw AuthenticationFailed(kName, operation, symbol,
                                   "HTTP " + std::to_string(resp.status) + ": " + snippet(resp.body));
    }
    return resp;
}

std::vector<MarketData> AlpacaProvider::fetch_bars(const std::string &symbol,
                                                   Timestamp start,
                                                   Timestamp end,
                                                   Timeframe tf) {
    constexpr const char *op = "fetch_bars";
    if (start > end) {
        throw std::invalid_argument("alpaca: fetch_bars start " + TimeCodec::to_iso8601(start) +
                                    " is after end " + TimeCodec::to_iso8601(end));
    }
    const std::string sym = venue_symbol(op, symbol);

    QueryParams q = {
        {"start", TimeCodec::to_iso8601(start)},
        {"end", TimeCodec::to_iso8601(end)},
        {"timeframe", std::string(alpaca_timeframe(tf))},
        {"adjustment", "all"},
        {"limit", std::to_string(kBarLimit)},
    };
    if (!endpoints().feed.empty()) q.emplace_back("feed", endpoints().feed);

    const auto resp = get(op, sym, endpoints().rest_base + "/v2/stocks/" + sym + "/bars", q);
    if (resp.status != 200) {
        throw TransportFailure(kName, op, sym, snippet(resp.body), resp.status);
    }

    AlpacaBarPage page;
    try {
        AlpacaRestParser parser;
        page = parser.parse_bars(resp.body, sym, kName);
    } catch (const std::exception &e) {
        throw TransportFailure(kName, op, sym, std::string("malformed response: ") + e.what(), resp.status);
    }

    if (page.skipped > 0) {
        deps_.logger->warn(kTag, "skipped " + std::to_string(page.skipped) + " malformed bars for " + sym);
    }
    if (page.next_page_token) {
        deps_.logger->warn(kTag, "bars for " + sym + " truncated at " + std::to_string(kBarLimit) + " records");
    }

    auto &bars = page.bars;
    const auto outside = std::remove_if(bars.begin(), bars.end(), [&](const MarketData &b) {
        return b.timestamp < start || b.timestamp > end;
    });
    if (outside != bars.end()) {
        deps_.logger->warn(kTag, "dropped " + std::to_string(std::distance(outside, bars.end())) +
                                     " bars outside the requested range for " + sym);
        bars.erase(outside, bars.end());
    }
    std::stable_sort(bars.begin(), bars.end(), [](const MarketData &a, const MarketData &b) {
        return a.timestamp < b.timestamp;
    });
    // one record per interval
    bars.erase(std::unique(bars.begin(), bars.end(), [](const MarketData &a, const MarketData &b) {
                   return a.timestamp == b.timestamp;
               }),
               bars.end());

    deps_.logger->info(kTag, "Fetched " + std::to_string(bars.size()) + " bars for " + sym + " from Alpaca");
    return std::move(bars);
}

MarketData AlpacaProvider::fetch_latest_quote(const std::string &symbol) {
    constexpr const char *op = "fetch_latest_quote";
    const std::string sym = venue_symbol(op, symbol);

    QueryParams q;
    if (!endpoints().feed.empty()) q.emplace_back("feed", endpoints().feed);

    const auto resp = get(op, sym, endpoints().rest_base + "/v2/stocks/" + sym + "/quotes/latest", q);
    if (resp.status != 200) {
        throw TransportFailure(kName, op, sym, snippet(resp.body), resp.status);
    }
    try {
        AlpacaRestParser parser;
        return parser.parse_latest_quote(resp.body, sym, kName);
    } catch (const std::exception &e) {
        throw TransportFailure(kName, op, sym, std::string("malformed response: ") + e.what(), resp.status);
    }
}

std::vector<OptionsQuote> AlpacaProvider::fetch_options_chain(const std::string &symbol,
                                                              std::optional<Timestamp> expiration) {
    constexpr const char *op = "fetch_options_chain";
    const std::string sym = venue_symbol(op, symbol);
    const std::string url = endpoints().rest_base + "/v1beta1/options/snapshots/" + sym;
    const std::optional<std::string> expiry_date =
        expiration ? std::optional<std::string>(TimeCodec::to_date(*expiration)) : std::nullopt;

    std::vector<OptionsQuote> chain;
    std::size_t skipped = 0;
    std::optional<std::string> page_token;
    AlpacaRestParser parser;

    for (int page_no = 0;; ++page_no) {
        if (page_no == kMaxOptionPages) {
            deps_.logger->warn(kTag, "options chain for " + sym + " stopped after " +
                                         std::to_string(kMaxOptionPages) + " pages");
            break;
        }

        QueryParams q = {{"limit", std::to_string(kOptionPageLimit)}};
        if (expiry_date) q.emplace_back("expiration_date", *expiry_date);
        if (page_token) q.emplace_back("page_token", *page_token);

        const auto resp = get(op, sym, url, q);
        if (resp.status == 404 && page_no == 0) {
            deps_.logger->warn(kTag, "Options data not available for " + sym);
            return {};
        }
        if (resp.status == 404) {
            // later pages vanishing leaves a partial chain
            deps_.logger->error(kTag, "options page " + std::to_string(page_no + 1) + " for " + sym +
                                          " disappeared after " + std::to_string(chain.size()) + " quotes");
            throw TransportFailure(kName, op, sym, "page " + std::to_string(page_no + 1) + " not found: " +
                                   snippet(resp.body), resp.status);
        }
        if (resp.status != 200) {
            throw TransportFailure(kName, op, sym, snippet(resp.body), resp.status);
        }

        AlpacaOptionPage page;
        try {
            page = parser.parse_option_snapshots(resp.body, sym);
        } catch (const std::exception &e) {
            throw TransportFailure(kName, op, sym, std::string("malformed response: ") + e.what(), resp.status);
        }
        skipped += page.skipped;
        for (auto &quote : page.quotes) {
            if (expiry_date && TimeCodec::to_date(quote.expiration) != *expiry_date) continue;
            chain.push_back(std::move(quote));
        }

        if (!page.next_page_token) break;
        page_token = std::move(page.next_page_token);
    }

    if (skipped > 0) {
        deps_.logger->warn(kTag, "skipped " + std::to_string(skipped) + " malformed option snapshots for " + sym);
    }
    std::sort(chain.begin(), chain.end(), [](const OptionsQuote &a, const OptionsQuote &b) {
        return std::tie(a.expiration, a.strike, a.type, a.contract) <
               std::tie(b.expiration, b.strike, b.type, b.contract);
    });
    deps_.logger->info(kTag, "Fetched " + std::to_string(chain.size()) + " option quotes for " + sym + " from Alpaca");
    return chain;
}

void AlpacaProvider::stream_trades(const std::vector<std::string> &symbols,
                                   const TradeSink &sink,
                                   std::stop_token stop) {
    if (!stream_endpoint_) throw CapabilityNotSupported(kName, Capability::TradeStream);

    std::stop_token closing;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!http_) throw std::logic_error("alpaca: stream_trades called before open()");
        closing = closing_.get_token();
    }

    std::vector<std::string> venue_symbols;
    venue_symbols.reserve(symbols.size());
    for (const auto &s : symbols) venue_symbols.push_back(venue_symbol("stream_trades", s));

    // stop when either the caller or close() asks
    std::stop_source cancel;
    std::stop_callback on_caller(stop, [&cancel] { cancel.request_stop(); });
    std::stop_callback on_close(closing, [&cancel] { cancel.request_stop(); });

    AlpacaStreamCodec codec(kName);
    StreamSession session(kName, *stream_endpoint_, deps_.connect_ws, codec, deps_.logger, deps_.stream);
    session.run(credential_, venue_symbols, sink, cancel.get_token());
    if (codec.malformed() > 0) {
        deps_.logger->warn("alpaca-ws", "dropped " + std::to_string(codec.malformed()) + " malformed envelopes");
    }
}
