#include "provider_deps.hpp"

ProviderDeps resolve_deps(const std::string &vendor, ProviderDeps deps) {
    if (!deps.logger) deps.logger = default_logger();
    if (!deps.make_http) {
        deps.make_http = [] { return make_curl_http_client(); };
    }
    if (!deps.connect_ws) {
        deps.connect_ws = [](const WsEndpoint &ep) { return make_beast_ws_connection(ep); };
    }
    if (!deps.endpoints) deps.endpoints = default_endpoints(vendor);
    return deps;
}
