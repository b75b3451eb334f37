#pragma once
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/notes/Note.hpp"

namespace notes {

void to_json(nlohmann::json& j, const Note& n);

// One rejected field of a request body.
struct ValidationIssue {
  std::vector<std::string> loc;  // e.g. {"body", "title"}
  std::string msg;
  std::string type;              // missing, string_type, string_too_short, ...
};

using ValidationIssues = std::vector<ValidationIssue>;

template <typename T>
using Parsed = std::variant<T, ValidationIssues>;

Parsed<NoteCreate> parse_note_create(const std::string& body);
Parsed<NoteUpdate> parse_note_update(const std::string& body);

// {"detail":[{"loc":[...],"msg":...,"type":...}, ...]}
nlohmann::json validation_error_body(const ValidationIssues& issues);

} // namespace notes
