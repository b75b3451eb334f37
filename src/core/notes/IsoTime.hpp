#pragma once
#include <string>

#include "Note.hpp"

namespace notes {
  // ISO-8601 UTC with microseconds, e.g. 2026-10-18T09:30:12.123456Z
  std::string to_iso8601(Timestamp t);
}
