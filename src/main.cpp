// src/main.cpp
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/config/ServiceConfig.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/UrlStore.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in . and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (URLSH_PORT or 8000)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const urlsh::ServiceConfig cfg = urlsh::loadServiceConfig();
    urlsh::applyLogLevel(cfg);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      urlsh::initDatabase(cfg.dbPath, findSchemaPath());
      spdlog::info("DB initialized at: {}", cfg.dbPath);
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Self-heal DB on startup (idempotent)
      urlsh::initDatabase(cfg.dbPath, findSchemaPath());

      urlsh::UrlStore store(cfg.dbPath, urlsh::ShortCodeGenerator(), cfg.maxAttempts);
      spdlog::info("store ready: db={} records={} max_attempts={}",
                   cfg.dbPath, store.count(), cfg.maxAttempts);

      return urlsh::run_http_server(store, cfg) ? 0 : 1;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    spdlog::critical("Fatal: {}", e.what());
    return 2;
  }
}
