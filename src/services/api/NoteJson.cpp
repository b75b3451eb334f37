#include "NoteJson.hpp"

#include <optional>

#include "core/notes/IsoTime.hpp"

using nlohmann::json;

namespace notes {

void to_json(json& j, const Note& n) {
  j = json{
    {"id", n.id},
    {"title", n.title},
    {"content", n.content},
    {"created_at", to_iso8601(n.created_at)},
    {"updated_at", to_iso8601(n.updated_at)}
  };
}

// -------- helpers --------

static ValidationIssue body_issue(const std::string& msg, const std::string& type) {
  return {{"body"}, msg, type};
}

static ValidationIssue field_issue(const char* field, const std::string& msg, const std::string& type) {
  return {{"body", field}, msg, type};
}

// Parses the body as a JSON object, or records why it is not one.
static std::optional<json> parse_object(const std::string& body, ValidationIssues& issues) {
  json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    issues.push_back(body_issue("JSON decode error", "json_invalid"));
    return std::nullopt;
  }
  if (!j.is_object()) {
    issues.push_back(body_issue("Input should be a valid dictionary or object", "model_attributes_type"));
    return std::nullopt;
  }
  return j;
}

// required: absent or null is "missing"; optional: absent or null is unset.
static std::optional<std::string> read_string(const json& j, const char* field, bool required,
                                              size_t min_length, ValidationIssues& issues) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    if (required) issues.push_back(field_issue(field, "Field required", "missing"));
    return std::nullopt;
  }
  if (!it->is_string()) {
    issues.push_back(field_issue(field, "Input should be a valid string", "string_type"));
    return std::nullopt;
  }
  auto s = it->get<std::string>();
  if (s.size() < min_length) {
    issues.push_back(field_issue(field, "String should have at least 1 character", "string_too_short"));
    return std::nullopt;
  }
  return s;
}

// -------- parsing --------

Parsed<NoteCreate> parse_note_create(const std::string& body) {
  ValidationIssues issues;
  auto j = parse_object(body, issues);
  if (!j) return issues;

  auto title = read_string(*j, "title", true, 1, issues);
  auto content = read_string(*j, "content", true, 0, issues);
  if (!issues.empty()) return issues;
  return NoteCreate{*title, *content};
}

Parsed<NoteUpdate> parse_note_update(const std::string& body) {
  ValidationIssues issues;
  auto j = parse_object(body, issues);
  if (!j) return issues;

  NoteUpdate out;
  out.title = read_string(*j, "title", false, 1, issues);
  out.content = read_string(*j, "content", false, 0, issues);
  if (!issues.empty()) return issues;
  return out;
}

json validation_error_body(const ValidationIssues& issues) {
  json detail = json::array();
  for (const auto& i : issues) {
    detail.push_back(json{{"loc", i.loc}, {"msg", i.msg}, {"type", i.type}});
  }
  return json{{"detail", detail}};
}

} // namespace notes
