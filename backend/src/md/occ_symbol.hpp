#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "md_types.hpp"

// Decoded OCC option symbol: root + YYMMDD + C/P + strike * 1000 (8 digits).
// "AAPL240119C00150000" -> AAPL, 2024-01-19, Call, 150.
// The padded 21-character form ("AAPL  240119C00150000") is accepted too.
struct OccSymbol
{
    std::string underlying;
    Timestamp expiration{}; // expiry date at 00:00 UTC
    OptionType type{OptionType::Call};
    Decimal strike;

    static std::optional<OccSymbol> parse(std::string_view contract);
};
