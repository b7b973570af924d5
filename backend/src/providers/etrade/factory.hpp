#pragma once

#include "providers/etrade/api.hpp"
#include "providers/provider_factory.hpp"

inline ProviderFactory make_etrade_factory() {
    ProviderFactory factory;
    factory.name = EtradeProvider::kName;
    factory.make_provider = [](ProviderCredential credential, ProviderDeps deps)
        -> std::unique_ptr<IMarketDataProvider> {
        return std::make_unique<EtradeProvider>(std::move(credential), std::move(deps));
    };
    return factory;
}
