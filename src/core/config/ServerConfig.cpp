#include "ServerConfig.hpp"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace notes {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int env_port_or_default(int defval) {
  const std::string raw = get_env_or("NOTES_PORT", "");
  if (raw.empty()) return defval;
  try {
    size_t pos = 0;
    const int port = std::stoi(raw, &pos);
    if (pos == raw.size() && port > 0 && port <= 65535) return port;
  } catch (const std::exception&) {
  }
  spdlog::warn("NOTES_PORT '{}' is not a valid port, using {}", raw, defval);
  return defval;
}

static spdlog::level::level_enum env_log_level_or_default(spdlog::level::level_enum defval) {
  const std::string raw = get_env_or("NOTES_LOG_LEVEL", "");
  if (raw.empty()) return defval;
  // from_str maps unknown names to off, so accept only names that round-trip
  const auto lvl = spdlog::level::from_str(raw);
  if (lvl != spdlog::level::off || raw == "off") return lvl;
  spdlog::warn("NOTES_LOG_LEVEL '{}' is not a known level", raw);
  return defval;
}

ServerConfig load_server_config() {
  ServerConfig cfg;
  cfg.host = get_env_or("NOTES_HOST", cfg.host);
  cfg.port = env_port_or_default(cfg.port);
  cfg.log_level = env_log_level_or_default(cfg.log_level);
  return cfg;
}

} // namespace notes
