#pragma once
#include <string>

#include <spdlog/common.h>

namespace notes {

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  spdlog::level::level_enum log_level = spdlog::level::info;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads NOTES_HOST, NOTES_PORT and NOTES_LOG_LEVEL; bad values fall back to defaults.
ServerConfig load_server_config();

} // namespace notes
