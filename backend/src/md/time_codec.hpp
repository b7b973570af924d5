#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "md_types.hpp"

struct TimeCodec
{
    // RFC-3339 / ISO-8601: "2024-01-02T05:00:00Z", "2024-01-02T09:30:00.123456-05:00",
    // or a bare date "2024-01-02" (midnight UTC). Throws std::invalid_argument.
    static Timestamp parse_iso8601(std::string_view text);
    static bool try_parse_iso8601(std::string_view text, Timestamp &out);

    // "2024-01-02T05:00:00Z"; fractional seconds only when non-zero.
    static std::string to_iso8601(Timestamp ts);
    // "2024-01-02"
    static std::string to_date(Timestamp ts);

    static Timestamp from_epoch_millis(std::int64_t ms);
    static std::int64_t to_epoch_millis(Timestamp ts);
};
