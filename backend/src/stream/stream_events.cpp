#include "stream_events.hpp"

const char *to_string(ControlKind kind)
{
    switch (kind)
    {
        case ControlKind::Connected:     return "connected";
        case ControlKind::Authenticated: return "authenticated";
        case ControlKind::AuthRejected:  return "auth rejected";
        case ControlKind::Subscribed:    return "subscribed";
        case ControlKind::Error:         return "error";
        case ControlKind::Other:         return "other";
    }
    return "unknown";
}
