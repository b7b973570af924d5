#include "provider_error.hpp"

#include <utility>

namespace {

std::string compose(ProviderErrc kind, const std::string& vendor, const std::string& operation,
                    const std::string& symbol, const std::string& detail) {
    std::string msg = vendor.empty() ? std::string("<none>") : vendor;
    if (!operation.empty()) {
        msg += " " + operation;
        if (!symbol.empty()) msg += "(" + symbol + ")";
    }
    msg += ": ";
    msg += to_string(kind);
    if (!detail.empty()) msg += ": " + detail;
    return msg;
}

} // namespace

const char* to_string(ProviderErrc kind) {
    switch (kind) {
        case ProviderErrc::CapabilityNotSupported: return "capability not supported";
        case ProviderErrc::NotImplemented:         return "not implemented";
        case ProviderErrc::AuthenticationFailed:   return "authentication failed";
        case ProviderErrc::TransportFailure:       return "transport failure";
        case ProviderErrc::UnknownProvider:        return "unknown provider";
    }
    return "error";
}

ProviderError::ProviderError(ProviderErrc kind, std::string vendor, std::string operation,
                             std::string symbol, const std::string& detail)
    : std::runtime_error(compose(kind, vendor, operation, symbol, detail))
    , kind_(kind)
    , vendor_(std::move(vendor))
    , operation_(std::move(operation))
    , symbol_(std::move(symbol)) {}

CapabilityNotSupported::CapabilityNotSupported(std::string vendor, Capability cap, std::string symbol)
    : ProviderError(ProviderErrc::CapabilityNotSupported, std::move(vendor), to_string(cap),
                    std::move(symbol), "")
    , capability_(cap) {}

NotImplemented::NotImplemented(std::string vendor, std::string operation)
    : ProviderError(ProviderErrc::NotImplemented, std::move(vendor), std::move(operation), "",
                    "vendor is recognized but has no integration yet") {}

AuthenticationFailed::AuthenticationFailed(std::string vendor, std::string operation,
                                           std::string symbol, const std::string& detail)
    : ProviderError(ProviderErrc::AuthenticationFailed, std::move(vendor), std::move(operation),
                    std::move(symbol), detail) {}

TransportFailure::TransportFailure(std::string vendor, std::string operation, std::string symbol,
                                   const std::string& detail, std::optional<long> http_status)
    : ProviderError(ProviderErrc::TransportFailure, std::move(vendor), std::move(operation),
                    std::move(symbol),
                    http_status ? "HTTP " + std::to_string(*http_status) + (detail.empty() ? "" : " " + detail)
                                : detail)
    , http_status_(http_status) {}

UnknownProvider::UnknownProvider(std::string vendor_id)
    : ProviderError(ProviderErrc::UnknownProvider, std::move(vendor_id), "create_provider", "", "") {}
