#pragma once
#include <string>

#include "core/metadata/StoreError.hpp"

namespace httplib { class Server; }

namespace urlsh {

class UrlStore;
struct ServiceConfig;

int http_status_for(ErrorKind kind);

// Installs the shortener routes on svr. store must outlive svr.
void register_routes(httplib::Server& svr, UrlStore& store);

// Start a blocking HTTP server on cfg.host:cfg.port.
// Returns false if the address could not be bound.
bool run_http_server(UrlStore& store, const ServiceConfig& cfg);

} // namespace urlsh
