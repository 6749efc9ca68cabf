#pragma once
#include <string>

namespace urlsh {

struct ServiceConfig {
  std::string dbPath      = "data/urls.db";
  std::string host        = "0.0.0.0";
  int         port        = 8000;
  int         maxAttempts = 10;
  std::string logLevel    = "info";
};

std::string get_env_or(const char* key, const std::string& defval);

// URLSH_DB_PATH (falls back to DB_PATH), URLSH_HOST, URLSH_PORT,
// URLSH_MAX_ATTEMPTS, URLSH_LOG_LEVEL. Malformed numbers keep the default.
ServiceConfig loadServiceConfig();

// Applies cfg.logLevel to spdlog's default logger; unknown names mean info.
void applyLogLevel(const ServiceConfig& cfg);

} // namespace urlsh
