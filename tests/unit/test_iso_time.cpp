#include <gtest/gtest.h>
#include "core/notes/IsoTime.hpp"

using namespace notes;
using namespace std::chrono;

TEST(IsoTimeTest, FormatsEpoch) {
  EXPECT_EQ(to_iso8601(Timestamp{}), "1970-01-01T00:00:00.000000Z");
}

TEST(IsoTimeTest, FormatsMicroseconds) {
  // 2023-11-14T22:13:20Z
  Timestamp t = Timestamp(seconds(1700000000)) + microseconds(123456);
  EXPECT_EQ(to_iso8601(t), "2023-11-14T22:13:20.123456Z");
}

TEST(IsoTimeTest, TruncatesSubMicrosecondPrecision) {
  Timestamp t = Timestamp(seconds(1700000000)) +
                duration_cast<system_clock::duration>(nanoseconds(999999));
  EXPECT_EQ(to_iso8601(t), "2023-11-14T22:13:20.000999Z");
}

TEST(IsoTimeTest, HandlesTimesBeforeEpoch) {
  Timestamp t = Timestamp{} - microseconds(1);
  EXPECT_EQ(to_iso8601(t), "1969-12-31T23:59:59.999999Z");
}
