#pragma once
#include <cstdint>
#include <string>
#include <variant>

#include "md/md_types.hpp"

enum class ControlKind : std::uint8_t
{
    Connected = 0,     // server greeting after the WebSocket upgrade
    Authenticated = 1,
    AuthRejected = 2,
    Subscribed = 3,
    Error = 4,         // vendor error envelope not tied to authentication
    Other = 5          // envelope types the core does not translate (quotes, statuses, ...)
};

const char *to_string(ControlKind kind);

struct ControlMessage
{
    ControlKind kind{ControlKind::Other};
    int code{0};        // vendor error code if any
    std::string detail; // vendor message text or envelope type
};

// A decoded frame is a batch of these, in frame order.
using StreamEvent = std::variant<MarketData, ControlMessage>;
