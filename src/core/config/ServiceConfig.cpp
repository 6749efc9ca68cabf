#include "ServiceConfig.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace urlsh {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int env_int_or(const char* key, int defval, int minval, int maxval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    int v = std::stoi(raw, &used);
    if (used != raw.size() || v < minval || v > maxval) {
      spdlog::warn("ignoring {}={} (using {})", key, raw, defval);
      return defval;
    }
    return v;
  } catch (const std::logic_error&) {
    spdlog::warn("ignoring {}={} (using {})", key, raw, defval);
    return defval;
  }
}

ServiceConfig loadServiceConfig() {
  ServiceConfig cfg;
  cfg.dbPath      = get_env_or("URLSH_DB_PATH", get_env_or("DB_PATH", cfg.dbPath));
  cfg.host        = get_env_or("URLSH_HOST", cfg.host);
  cfg.port        = env_int_or("URLSH_PORT", cfg.port, 1, 65535);
  cfg.maxAttempts = env_int_or("URLSH_MAX_ATTEMPTS", cfg.maxAttempts, 1, 1000);
  cfg.logLevel    = get_env_or("URLSH_LOG_LEVEL", cfg.logLevel);
  return cfg;
}

void applyLogLevel(const ServiceConfig& cfg) {
  auto lvl = spdlog::level::from_str(cfg.logLevel);
  // from_str maps unknown names to off; only "off" itself should silence us.
  if (lvl == spdlog::level::off && cfg.logLevel != "off") {
    spdlog::warn("unknown log level '{}', using info", cfg.logLevel);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

} // namespace urlsh
