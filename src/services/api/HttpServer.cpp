#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "core/config/ServiceConfig.hpp"
#include "core/metadata/UrlStore.hpp"

using nlohmann::json;

namespace urlsh {

int http_status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInput:       return 400;
    case ErrorKind::NotFound:           return 404;
    case ErrorKind::ExhaustedRetries:   return 500;
    case ErrorKind::StorageUnavailable: return 503;
  }
  return 500;
}

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(const httplib::Request& req, httplib::Response& res,
                       const StoreError& e) {
  const int status = http_status_for(e.kind());
  if (status >= 500) {
    spdlog::error("{} {}: {} ({})", req.method, req.path, to_string(e.kind()), e.what());
  } else {
    spdlog::warn("{} {}: {} ({})", req.method, req.path, to_string(e.kind()), e.what());
  }
  send_json(res, status, {{"error", to_string(e.kind())}, {"detail", e.what()}});
}

// Runs fn and turns StoreError into the matching error response.
template <typename Fn>
static void guarded(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
  } catch (const StoreError& e) {
    send_error(req, res, e);
  }
}

// -------- routes --------

void register_routes(httplib::Server& svr, UrlStore& store) {
  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, "Welcome to URL Shortner Microservice");
  });

  svr.Get("/health", [&store](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      send_json(res, 200, {{"status", "ok"}, {"urls", store.count()}});
    });
  });

  // POST /shortenURL?url=<urlencoded>
  svr.Post("/shortenURL", [&store](const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("url")) {
      spdlog::warn("POST /shortenURL without url parameter");
      send_json(res, 422, {{"error", "InvalidInput"}, {"detail", "query parameter 'url' required"}});
      return;
    }
    const std::string url = req.get_param_value("url");
    guarded(req, res, [&] {
      const std::string code = store.create(url);
      send_json(res, 200, {{"short_code", code}});
    });
  });

  svr.Get("/getAllUrls", [&store](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      json out = json::array();
      for (const auto& r : store.listAll()) {
        out.push_back({{"url", r.original_url}, {"short_url", r.short_code}});
      }
      send_json(res, 200, out);
    });
  });

  svr.Get(R"(/s/([A-Za-z0-9]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      send_json(res, 200, {{"url", store.resolve(req.matches[1].str())}});
    });
  });

  svr.Get(R"(/r/([A-Za-z0-9]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      res.set_redirect(store.resolve(req.matches[1].str()), 302);
    });
  });

  svr.Delete(R"(/deleteUrl/([A-Za-z0-9]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const std::string code = req.matches[1].str();
      store.remove(code);
      send_json(res, 200, {{"deleted", code}});
    });
  });

  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      res.set_content(json({{"error", "NotFound"}, {"detail", "no such route"}}).dump(),
                      "application/json");
    }
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });
}

bool run_http_server(UrlStore& store, const ServiceConfig& cfg) {
  httplib::Server svr;
  register_routes(svr, store);

  spdlog::info("HTTP server listening on http://{}:{}", cfg.host, cfg.port);
  if (!svr.listen(cfg.host.c_str(), cfg.port)) {
    spdlog::error("Failed to bind {}:{}", cfg.host, cfg.port);
    return false;
  }
  return true;
}

} // namespace urlsh
