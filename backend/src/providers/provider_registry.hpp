#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "market_data_provider.hpp"
#include "provider_factory.hpp"

class ProviderRegistry {
public:
    static const ProviderRegistry& instance();

    // Case-insensitive. nullptr for unknown vendors.
    const ProviderFactory* find(std::string_view vendor_id) const;

    // Every recognized vendor id, sorted, integrated or not.
    std::vector<std::string> list_names() const;

private:
    ProviderRegistry();

    void register_factory(ProviderFactory factory);

    std::unordered_map<std::string, ProviderFactory> factories_;
};

// Builds the provider for `vendor_id` without doing any I/O.
// Throws UnknownProvider for ids the registry does not know and
// NotImplemented for recognized vendors without an integration.
std::unique_ptr<IMarketDataProvider> create_provider(std::string_view vendor_id,
                                                     ProviderCredential credential,
                                                     ProviderDeps deps = {});
