#pragma once

#include "providers/alpaca/api.hpp"
#include "providers/provider_factory.hpp"

inline ProviderFactory make_alpaca_factory() {
    ProviderFactory factory;
    factory.name = AlpacaProvider::kName;
    factory.make_provider = [](ProviderCredential credential, ProviderDeps deps)
        -> std::unique_ptr<IMarketDataProvider> {
        return std::make_unique<AlpacaProvider>(std::move(credential), std::move(deps));
    };
    return factory;
}
