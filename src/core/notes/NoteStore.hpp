#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Note.hpp"

namespace notes {

/*
 * In-memory note repository.
 * Each call is atomic on its own; there are no multi-call transactions, so an
 * update racing a remove on the same id resolves to whichever runs last.
 */
class NoteStore {
public:
  using Clock = std::function<Timestamp()>;

  NoteStore();
  explicit NoteStore(Clock clock);

  // Throws std::invalid_argument on an empty title.
  Note create(const NoteCreate& in);
  std::optional<Note> get(const std::string& id) const;
  // Replaces the stored value; updated_at is refreshed even if nothing is set.
  std::optional<Note> update(const std::string& id, const NoteUpdate& in);
  bool remove(const std::string& id);
  // Snapshot ordered by created_at, then id.
  std::vector<Note> list() const;
  std::size_t size() const;

private:
  Clock clock_;
  std::unordered_map<std::string, Note> notes_;
  mutable std::shared_mutex mutex_;
};

} // namespace notes
