#pragma once
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "stream_events.hpp"

// Vendor framing for the trade stream: builds outbound control messages and
// decodes inbound frames into StreamEvents.
struct IStreamCodec {
    virtual ~IStreamCodec() = default;

    virtual std::string auth_message(const ProviderCredential& credential) const = 0;
    virtual std::string subscribe_message(const std::vector<std::string>& symbols) const = 0;

    // Appends the events of one text frame to `out`. Individual malformed
    // envelopes are skipped; a frame that is not parseable at all throws std::runtime_error.
    virtual void decode(const std::string& raw, std::vector<StreamEvent>& out) = 0;
};
