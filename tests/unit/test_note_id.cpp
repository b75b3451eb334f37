#include <gtest/gtest.h>
#include "core/notes/NoteId.hpp"
#include <regex>

using namespace notes;

TEST(NoteIdTest, LooksLikeUuidV4) {
  static const std::regex uuid4(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  for (int i = 0; i < 1000; ++i) {
    const auto id = generate_note_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_TRUE(std::regex_match(id, uuid4)) << id;
  }
}

TEST(NoteIdTest, ConsecutiveIdsDiffer) {
  EXPECT_NE(generate_note_id(), generate_note_id());
}
