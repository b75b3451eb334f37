#include "NoteStore.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "NoteId.hpp"

namespace notes {

NoteStore::NoteStore() : NoteStore(Clock([] { return std::chrono::system_clock::now(); })) {}

NoteStore::NoteStore(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) throw std::invalid_argument("NoteStore clock must be callable");
}

Note NoteStore::create(const NoteCreate& in) {
  if (in.title.empty()) throw std::invalid_argument("note title must not be empty");

  std::unique_lock lock(mutex_);
  std::string id = generate_note_id();
  while (notes_.count(id) != 0) id = generate_note_id();

  const Timestamp now = clock_();
  Note note{id, in.title, in.content, now, now};
  notes_.emplace(id, note);
  spdlog::debug("note {} created", id);
  return note;
}

std::optional<Note> NoteStore::get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = notes_.find(id);
  return it != notes_.end() ? std::make_optional(it->second) : std::nullopt;
}

std::optional<Note> NoteStore::update(const std::string& id, const NoteUpdate& in) {
  if (in.title && in.title->empty()) throw std::invalid_argument("note title must not be empty");

  std::unique_lock lock(mutex_);
  auto it = notes_.find(id);
  if (it == notes_.end()) return std::nullopt;

  const Note& prior = it->second;
  Note next{
    prior.id,
    in.title ? *in.title : prior.title,
    in.content ? *in.content : prior.content,
    prior.created_at,
    std::max(clock_(), prior.updated_at)
  };
  it->second = next;
  spdlog::debug("note {} updated", id);
  return next;
}

bool NoteStore::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  const bool removed = notes_.erase(id) > 0;
  if (removed) spdlog::debug("note {} deleted", id);
  return removed;
}

std::vector<Note> NoteStore::list() const {
  std::vector<Note> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(notes_.size());
    for (const auto& kv : notes_) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const Note& a, const Note& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return out;
}

std::size_t NoteStore::size() const {
  std::shared_lock lock(mutex_);
  return notes_.size();
}

} // namespace notes
