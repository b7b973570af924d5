#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "capability.hpp"

enum class ProviderErrc {
    CapabilityNotSupported, // provider never offers the operation
    NotImplemented,         // vendor recognized, integration missing
    AuthenticationFailed,   // credential rejected by the REST API or the stream handshake
    TransportFailure,       // network / HTTP / WebSocket / malformed response
    UnknownProvider,        // factory given an unrecognized vendor id
};

const char* to_string(ProviderErrc kind);

// Base of every error raised by the ingestion core. Carries enough context
// (vendor, operation, symbol) for a caller to log and decide on retry.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrc kind, std::string vendor, std::string operation,
                  std::string symbol, const std::string& detail);

    ProviderErrc kind() const noexcept { return kind_; }
    const std::string& vendor() const noexcept { return vendor_; }
    const std::string& operation() const noexcept { return operation_; }
    const std::string& symbol() const noexcept { return symbol_; }

private:
    ProviderErrc kind_;
    std::string vendor_;
    std::string operation_;
    std::string symbol_;
};

class CapabilityNotSupported : public ProviderError {
public:
    CapabilityNotSupported(std::string vendor, Capability cap, std::string symbol = {});

    Capability capability() const noexcept { return capability_; }

private:
    Capability capability_;
};

class NotImplemented : public ProviderError {
public:
    explicit NotImplemented(std::string vendor, std::string operation = "create_provider");
};

class AuthenticationFailed : public ProviderError {
public:
    AuthenticationFailed(std::string vendor, std::string operation, std::string symbol,
                         const std::string& detail);
};

class TransportFailure : public ProviderError {
public:
    TransportFailure(std::string vendor, std::string operation, std::string symbol,
                     const std::string& detail, std::optional<long> http_status = std::nullopt);

    // HTTP status when the failure came from a REST response.
    const std::optional<long>& http_status() const noexcept { return http_status_; }

private:
    std::optional<long> http_status_;
};

class UnknownProvider : public ProviderError {
public:
    explicit UnknownProvider(std::string vendor_id);
};
