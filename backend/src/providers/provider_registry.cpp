#include "provider_registry.hpp"

#include <algorithm>
#include <cctype>

#include "alpaca/factory.hpp"
#include "etrade/factory.hpp"
#include "provider_error.hpp"

namespace {

std::string normalize(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (char ch : id) {
        if (ch == ' ' || ch == '\t') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

// Recognized vendors that have no integration.
ProviderFactory placeholder(std::string name) {
    ProviderFactory factory;
    factory.name = std::move(name);
    return factory;
}

} // namespace

const ProviderRegistry& ProviderRegistry::instance() {
    static ProviderRegistry registry;
    return registry;
}

ProviderRegistry::ProviderRegistry() {
    register_factory(make_alpaca_factory());
    register_factory(make_etrade_factory());
    register_factory(placeholder("fidelity"));
    register_factory(placeholder("polygon"));
    register_factory(placeholder("iex"));
}

void ProviderRegistry::register_factory(ProviderFactory factory) {
    if (factory.name.empty()) {
        return;
    }
    factories_.emplace(normalize(factory.name), std::move(factory));
}

const ProviderFactory* ProviderRegistry::find(std::string_view vendor_id) const {
    auto it = factories_.find(normalize(vendor_id));
    if (it == factories_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> ProviderRegistry::list_names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& kv : factories_) {
        names.push_back(kv.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::unique_ptr<IMarketDataProvider> create_provider(std::string_view vendor_id,
                                                     ProviderCredential credential,
                                                     ProviderDeps deps) {
    const ProviderFactory* factory = ProviderRegistry::instance().find(vendor_id);
    if (!factory) {
        throw UnknownProvider(std::string(vendor_id));
    }
    if (!factory->make_provider) {
        throw NotImplemented(factory->name);
    }
    return factory->make_provider(std::move(credential), std::move(deps));
}
