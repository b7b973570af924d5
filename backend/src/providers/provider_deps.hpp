#pragma once

#include <memory>
#include <optional>

#include "config/provider_config.hpp"
#include "stream/stream_session.hpp"
#include "transport/http_client.hpp"
#include "transport/ws_connection.hpp"
#include "util/logger.hpp"

// Collaborators handed to a provider by the factory. Empty members fall back
// to the production implementations (curl, Beast, default_logger(),
// default_endpoints()); tests inject fakes here.
struct ProviderDeps {
    std::shared_ptr<ILogger> logger;
    HttpClientFactory make_http;
    WsConnector connect_ws;
    std::optional<ProviderEndpoints> endpoints;
    StreamSession::Options stream;
};

// Copy of `deps` with every empty member filled in for `vendor`.
ProviderDeps resolve_deps(const std::string &vendor, ProviderDeps deps);
