#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/provider_config.hpp"
#include "md/data_quality.hpp"
#include "md/time_codec.hpp"
#include "md/timeframe.hpp"
#include "md/trade_feed.hpp"
#include "providers/provider_error.hpp"
#include "providers/provider_registry.hpp"
#include "providers/provider_session.hpp"
#include "util/json_encode.hpp"
#include "util/logger.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

// Bad command line; reported with the usage text and exit code 2.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void print_usage(std::ostream& os) {
    os << "usage: md_ingest [--env FILE] [--vendor V] [--verbose] COMMAND\n"
       << "  bars SYMBOL START END [TIMEFRAME]   historical bars (default timeframe 1d)\n"
       << "  quote SYMBOL                       latest quote midpoint\n"
       << "  options SYMBOL [EXPIRY]            options chain, optionally one expiration\n"
       << "  stream SYMBOL... [--seconds N]     live trades until Ctrl-C or N seconds\n"
       << "  quality SYMBOL START END [TIMEFRAME] bar gap, staleness, outlier and volume report\n"
       << "vendors:";
    for (const auto& name : ProviderRegistry::instance().list_names()) os << " " << name;
    os << "\n";
}

struct Args {
    std::string env_file = ".env";
    std::string vendor = "alpaca";
    bool verbose = false;
    std::optional<int> seconds;
    std::vector<std::string> positional;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](const char* flag) {
            if (i + 1 >= argc) throw UsageError(std::string(flag) + " needs a value");
            return std::string(argv[++i]);
        };
        if (a == "--env") {
            args.env_file = value("--env");
        } else if (a == "--vendor") {
            args.vendor = value("--vendor");
        } else if (a == "--verbose" || a == "-v") {
            args.verbose = true;
        } else if (a == "--seconds") {
            const std::string v = value("--seconds");
            try {
                args.seconds = std::stoi(v);
            } catch (const std::exception&) {
                throw UsageError("--seconds expects a number, got '" + v + "'");
            }
            if (*args.seconds <= 0) throw UsageError("--seconds must be positive");
        } else if (a == "--help" || a == "-h") {
            args.positional.clear();
            args.positional.push_back("help");
            return args;
        } else if (a.rfind("--", 0) == 0) {
            throw UsageError("unknown option " + a);
        } else {
            args.positional.push_back(a);
        }
    }
    if (args.positional.empty()) throw UsageError("missing command");
    return args;
}

Timestamp parse_time_arg(const std::string& text) {
    Timestamp ts{};
    if (!TimeCodec::try_parse_iso8601(text, ts)) {
        throw UsageError("invalid date/time '" + text + "' (expected YYYY-MM-DD or RFC-3339)");
    }
    return ts;
}

Timeframe parse_timeframe_arg(const std::string& text) {
    try {
        return parse_timeframe(text);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
}

int run_bars(IMarketDataProvider& p, const std::vector<std::string>& pos) {
    if (pos.size() < 4 || pos.size() > 5) throw UsageError("bars SYMBOL START END [TIMEFRAME]");
    const Timestamp start = parse_time_arg(pos[2]);
    const Timestamp end = parse_time_arg(pos[3]);
    if (start > end) throw UsageError("START is after END");
    const Timeframe tf = pos.size() == 5 ? parse_timeframe_arg(pos[4]) : Timeframe::Day1;

    for (const auto& bar : p.fetch_bars(pos[1], start, end, tf)) {
        std::cout << to_json(bar) << "\n";
    }
    std::cout.flush();
    return 0;
}

int run_quote(IMarketDataProvider& p, const std::vector<std::string>& pos) {
    if (pos.size() != 2) throw UsageError("quote SYMBOL");
    std::cout << to_json(p.fetch_latest_quote(pos[1])) << std::endl;
    return 0;
}

int run_options(IMarketDataProvider& p, const std::vector<std::string>& pos) {
    if (pos.size() < 2 || pos.size() > 3) throw UsageError("options SYMBOL [EXPIRY]");
    std::optional<Timestamp> expiry;
    if (pos.size() == 3) expiry = parse_time_arg(pos[2]);

    for (const auto& q : p.fetch_options_chain(pos[1], expiry)) {
        std::cout << to_json(q) << "\n";
    }
    std::cout.flush();
    return 0;
}

int run_quality(IMarketDataProvider& p, const std::vector<std::string>& pos, const std::shared_ptr<ILogger>& log) {
    if (pos.size() < 4 || pos.size() > 5) throw UsageError("quality SYMBOL START END [TIMEFRAME]");
    const Timestamp start = parse_time_arg(pos[2]);
    const Timestamp end = parse_time_arg(pos[3]);
    if (start > end) throw UsageError("START is after END");
    const Timeframe tf = pos.size() == 5 ? parse_timeframe_arg(pos[4]) : Timeframe::Day1;

    const auto bars = p.fetch_bars(pos[1], start, end, tf);
    const auto now = std::chrono::time_point_cast<Timestamp::duration>(std::chrono::system_clock::now());
    DataQualityMonitor monitor({}, log);

    std::map<std::string, std::vector<QualityIssue>> issues;
    issues[pos[1]] = monitor.run_all(pos[1], bars, tf, now);
    std::cout << quality_report(issues, now) << std::flush;
    return 0;
}

int run_stream(IMarketDataProvider& p, const std::vector<std::string>& pos,
               std::optional<int> seconds, const std::shared_ptr<ILogger>& log) {
    if (pos.size() < 2) throw UsageError("stream SYMBOL... [--seconds N]");
    std::vector<std::string> symbols(pos.begin() + 1, pos.end());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    TradeFeed<> feed(p, symbols, Backpressure::Block, log);
    feed.start();

    using clock = std::chrono::steady_clock;
    const auto deadline = seconds ? std::optional<clock::time_point>(clock::now() + std::chrono::seconds(*seconds))
                                  : std::nullopt;
    MarketData trade;
    for (;;) {
        bool any = false;
        while (feed.try_pop(trade)) {
            std::cout << to_json(trade) << "\n";
            any = true;
        }
        if (any) std::cout.flush();

        if (g_interrupted.load() || (deadline && clock::now() >= deadline) || !feed.running()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    feed.stop(); // rethrows a stream failure
    while (feed.try_pop(trade)) std::cout << to_json(trade) << "\n";
    std::cout.flush();

    log->info("stream", std::to_string(feed.enqueued()) + " trades received");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "md_ingest: " << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }
    if (args.positional.front() == "help") {
        print_usage(std::cout);
        return 0;
    }

    // stdout carries records; all diagnostics go to stderr
    auto log = std::make_shared<StderrLogger>(args.verbose ? LogLevel::Debug : LogLevel::Info, false);

    if (!load_env_file(args.env_file)) {
        log->debug("setup", "no env file at " + args.env_file + ", using process environment");
    }

    try {
        const std::string& cmd = args.positional.front();
        if (cmd != "bars" && cmd != "quote" && cmd != "options" && cmd != "stream" && cmd != "quality") {
            throw UsageError("unknown command '" + cmd + "'");
        }

        // vendor errors before credential errors
        const ProviderFactory* factory = ProviderRegistry::instance().find(args.vendor);
        if (!factory) throw UnknownProvider(args.vendor);
        if (!factory->make_provider) throw NotImplemented(factory->name);

        const ProviderConfig cfg = provider_config_from_env(args.vendor);

        ProviderDeps deps;
        deps.logger = log;
        deps.endpoints = cfg.endpoints;
        auto provider = create_provider(cfg.vendor, cfg.credential, deps);
        log->debug("setup", "provider " + provider->name() + " against " + cfg.endpoints.rest_base);

        ProviderSession session(*provider);
        if (cmd == "bars") return run_bars(session.provider(), args.positional);
        if (cmd == "quote") return run_quote(session.provider(), args.positional);
        if (cmd == "options") return run_options(session.provider(), args.positional);
        if (cmd == "quality") return run_quality(session.provider(), args.positional, log);
        return run_stream(session.provider(), args.positional, args.seconds, log);
    } catch (const UsageError& e) {
        std::cerr << "md_ingest: " << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    } catch (const std::exception& e) {
        // ProviderError, configuration and transport errors
        log->error("md_ingest", e.what());
        return 1;
    }
}
