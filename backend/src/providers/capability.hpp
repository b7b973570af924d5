#pragma once
#include <cstdint>
#include <initializer_list>

enum class Capability : std::uint8_t {
    HistoricalBars = 1 << 0,
    LatestQuote    = 1 << 1,
    TradeStream    = 1 << 2,
    OptionsChain   = 1 << 3,
};

// Operation name used in logs and error messages, e.g. "fetch_bars".
const char* to_string(Capability cap);

class CapabilitySet {
public:
    constexpr CapabilitySet() = default;
    constexpr CapabilitySet(std::initializer_list<Capability> caps) {
        for (auto c : caps) bits_ |= static_cast<std::uint8_t>(c);
    }

    constexpr bool contains(Capability c) const { return (bits_ & static_cast<std::uint8_t>(c)) != 0; }
    constexpr bool empty() const { return bits_ == 0; }

private:
    std::uint8_t bits_{0};
};
