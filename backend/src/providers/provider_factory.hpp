#pragma once

#include <functional>
#include <memory>
#include <string>

#include "md/md_types.hpp"
#include "provider_deps.hpp"

class IMarketDataProvider;

struct ProviderFactory {
    std::string name; // lower-case vendor id
    // Empty for vendors that are recognized but not integrated.
    std::function<std::unique_ptr<IMarketDataProvider>(ProviderCredential, ProviderDeps)> make_provider;
};
