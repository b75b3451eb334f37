#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace notes {

using Timestamp = std::chrono::system_clock::time_point;

struct Note {
  std::string id;
  std::string title;
  std::string content;
  Timestamp   created_at;
  Timestamp   updated_at;
};

inline bool operator==(const Note& a, const Note& b) {
  return a.id == b.id && a.title == b.title && a.content == b.content &&
         a.created_at == b.created_at && a.updated_at == b.updated_at;
}

inline bool operator!=(const Note& a, const Note& b) { return !(a == b); }

struct NoteCreate {
  std::string title;
  std::string content;
};

// Unset fields are left unchanged by NoteStore::update.
struct NoteUpdate {
  std::optional<std::string> title;
  std::optional<std::string> content;
};

} // namespace notes
