#pragma once
#include <string>

struct SymbolCodec
{
    // Convert canonical ("BRK.B") to vendor format ("BRK.B" for Alpaca, "BRK-B" for E*TRADE).
    static std::string to_venue(const std::string &vendor, const std::string &canonical);
    // Convert vendor format back to canonical.
    static std::string to_canonical(const std::string &vendor, const std::string &vendor_sym);
};
