#pragma once

#include "market_data_provider.hpp"

// Scoped open()/close() of a provider. The provider is closed on every exit
// path, including exceptions thrown by the caller's code.
class ProviderSession {
public:
    explicit ProviderSession(IMarketDataProvider &provider) : provider_(provider) {
        provider_.open();
    }
    ~ProviderSession() { provider_.close(); }

    ProviderSession(const ProviderSession &) = delete;
    ProviderSession &operator=(const ProviderSession &) = delete;

    IMarketDataProvider &provider() { return provider_; }
    IMarketDataProvider *operator->() { return &provider_; }

private:
    IMarketDataProvider &provider_;
};
