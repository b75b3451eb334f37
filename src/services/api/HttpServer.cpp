#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <string>
#include <variant>

#include "core/config/ServerConfig.hpp"
#include "core/notes/NoteStore.hpp"
#include "NoteJson.hpp"

using nlohmann::json;

// -------- helpers --------

static const char* kNoteNotFound = "Note not found";

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_detail(httplib::Response& res, int status, const std::string& detail) {
  send_json(res, status, json{{"detail", detail}});
}

// Any origin may call with credentials, so the origin is echoed instead of "*".
static void apply_cors(const httplib::Request& req, httplib::Response& res) {
  const auto origin = req.get_header_value("Origin");
  if (origin.empty() || res.has_header("Access-Control-Allow-Origin")) return;
  res.set_header("Access-Control-Allow-Origin", origin);
  res.set_header("Access-Control-Allow-Credentials", "true");
  res.set_header("Vary", "Origin");
}

static void answer_preflight(const httplib::Request& req, httplib::Response& res) {
  apply_cors(req, res);
  res.set_header("Access-Control-Allow-Methods", "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT");
  const auto requested = req.get_header_value("Access-Control-Request-Headers");
  if (!requested.empty()) res.set_header("Access-Control-Allow-Headers", requested);
  res.set_header("Access-Control-Max-Age", "600");
  res.status = 200;
  res.set_content("OK", "text/plain");
}

static void redirect_to_collection(const httplib::Request&, httplib::Response& res) {
  res.set_redirect("/notes/", 307);
}

// -------- server --------

namespace notes {

void register_routes(httplib::Server& svr, NoteStore& store) {
  svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
    if (req.method != "OPTIONS") return httplib::Server::HandlerResponse::Unhandled;
    answer_preflight(req, res);
    return httplib::Server::HandlerResponse::Handled;
  });

  // Runs for every response, error responses included.
  svr.set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
    apply_cors(req, res);
  });

  // Health check
  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, json{{"message", "Healthy"}});
  });

  svr.Get("/notes", redirect_to_collection);
  svr.Post("/notes", redirect_to_collection);

  // GET /notes/
  svr.Get("/notes/", [&store](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, json(store.list()));
  });

  // POST /notes/
  // Body: {"title": <non-empty string>, "content": <string>}
  svr.Post("/notes/", [&store](const httplib::Request& req, httplib::Response& res) {
    auto parsed = parse_note_create(req.body);
    if (auto* issues = std::get_if<ValidationIssues>(&parsed)) {
      send_json(res, 422, validation_error_body(*issues));
      return;
    }
    const Note note = store.create(std::get<NoteCreate>(parsed));
    spdlog::info("created note {}", note.id);
    send_json(res, 201, json(note));
  });

  // GET /notes/{id}
  svr.Get(R"(/notes/([^/]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    auto note = store.get(req.matches[1].str());
    if (!note) { send_detail(res, 404, kNoteNotFound); return; }
    send_json(res, 200, json(*note));
  });

  // PUT /notes/{id}
  // Body: {"title"?: <non-empty string>, "content"?: <string>}; absent or null means unchanged.
  svr.Put(R"(/notes/([^/]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    auto parsed = parse_note_update(req.body);
    if (auto* issues = std::get_if<ValidationIssues>(&parsed)) {
      send_json(res, 422, validation_error_body(*issues));
      return;
    }
    auto note = store.update(req.matches[1].str(), std::get<NoteUpdate>(parsed));
    if (!note) { send_detail(res, 404, kNoteNotFound); return; }
    send_json(res, 200, json(*note));
  });

  // DELETE /notes/{id}
  svr.Delete(R"(/notes/([^/]+))", [&store](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1].str();
    if (!store.remove(id)) { send_detail(res, 404, kNoteNotFound); return; }
    spdlog::info("deleted note {}", id);
    res.status = 204;
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    } catch (...) {
      spdlog::error("{} {} failed with a non-standard exception", req.method, req.path);
    }
    send_detail(res, 500, "Internal Server Error");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) send_detail(res, 404, "Not Found");
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} -> {}", req.method, req.path, res.status);
  });
}

bool run_http_server(NoteStore& store, const ServerConfig& cfg) {
  httplib::Server svr;
  register_routes(svr, store);

  spdlog::info("HTTP server listening on http://{}:{}", cfg.host, cfg.port);
  if (!svr.listen(cfg.host, cfg.port)) {
    spdlog::error("Failed to bind {}:{}", cfg.host, cfg.port);
    return false;
  }
  return true;
}

} // namespace notes
