#pragma once

namespace httplib { class Server; }

namespace notes {
  class NoteStore;
  struct ServerConfig;

  // Mounts the health, notes CRUD and CORS handling onto svr.
  // store must outlive svr.
  void register_routes(httplib::Server& svr, NoteStore& store);

  // Start a blocking HTTP server; returns false if the address cannot be bound.
  bool run_http_server(NoteStore& store, const ServerConfig& cfg);
}
