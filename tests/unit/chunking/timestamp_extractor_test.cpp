#include <gtest/gtest.h>

#include "loglens_core/chunking/timestamp_extractor.hpp"

namespace loglens_core {

TEST(TimestampExtractorTest, KeepsIsoTimestamps) {
  auto timestamps = extract_timestamps("at 2024-01-15T10:30:45.123Z the job failed");

  ASSERT_EQ(timestamps.size(), 1u);
  EXPECT_EQ(timestamps[0], "2024-01-15T10:30:45.123Z");
}

TEST(TimestampExtractorTest, NormalisesSpaceSeparatedTimestamps) {
  auto timestamps = extract_timestamps("2024-01-15 10:30:45.500 WARN slow query");

  ASSERT_EQ(timestamps.size(), 1u);
  EXPECT_EQ(timestamps[0], "2024-01-15T10:30:45.500");
}

TEST(TimestampExtractorTest, NormalisesAccessLogTimestamps) {
  auto timestamps =
      extract_timestamps(R"(127.0.0.1 - - [15/Jan/2024:10:30:45 +0000] "GET / HTTP/1.1" 200)");

  ASSERT_EQ(timestamps.size(), 1u);
  EXPECT_EQ(timestamps[0], "2024-01-15T10:30:45");
}

TEST(TimestampExtractorTest, IgnoresUnknownMonths) {
  EXPECT_TRUE(extract_timestamps("12/Abc/2024:10:30:45").empty());
}

TEST(TimestampExtractorTest, RangeIsEarliestAndLatest) {
  auto range = extract_timestamp_range(
      "2024-01-15 10:31:00 b\n2024-01-15 10:29:00 a\n2024-01-15 10:35:00 c");

  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->first, "2024-01-15T10:29:00");
  EXPECT_EQ(range->second, "2024-01-15T10:35:00");
}

TEST(TimestampExtractorTest, NoTimestampsGivesNoRange) {
  EXPECT_FALSE(extract_timestamp_range("plain text without dates").has_value());
}

}  // namespace loglens_core
