// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/ServerConfig.hpp"
#include "core/notes/NoteStore.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve       # start HTTP server (NOTES_HOST/NOTES_PORT, default 0.0.0.0:8080)\n"
            << "\n"
            << "Environment:\n"
            << "  NOTES_HOST        bind address\n"
            << "  NOTES_PORT        TCP port\n"
            << "  NOTES_LOG_LEVEL   trace|debug|info|warn|err|critical|off\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc > 1 && std::string(argv[1]) == "--serve") {
      const notes::ServerConfig cfg = notes::load_server_config();
      spdlog::set_level(cfg.log_level);

      // Notes live only as long as the process
      notes::NoteStore store;

      if (!notes::run_http_server(store, cfg)) return 1;
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
