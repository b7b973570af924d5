#include "capability.hpp"

const char* to_string(Capability cap) {
    switch (cap) {
        case Capability::HistoricalBars: return "fetch_bars";
        case Capability::LatestQuote:    return "fetch_latest_quote";
        case Capability::TradeStream:    return "stream_trades";
        case Capability::OptionsChain:   return "fetch_options_chain";
    }
    return "unknown";
}
