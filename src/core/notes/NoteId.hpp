#pragma once
#include <string>

namespace notes {
  // Random RFC 4122 version 4 UUID, lowercase hex with hyphens.
  std::string generate_note_id();
}
