#include <solid/escaping.h>

#include <gtest/gtest.h>

namespace {

TEST(EscapingTest, EscapesControlCharacters) {
  const std::string input = "value\twith\ncontrols\\";
  const std::string escaped = solid::EscapeField(input);

  EXPECT_EQ("value\\twith\\ncontrols\\\\", escaped);
}

TEST(EscapingTest, UnescapeRestoresEscapedSequences) {
  const std::string escaped = "value\\twith\\ncontrols\\\\";
  EXPECT_EQ("value\twith\ncontrols\\", solid::UnescapeField(escaped));
}

TEST(EscapingTest, SplitRecordHandlesEscapedTabs) {
  const std::string line =
      "first\tsecond\\twith\\nescaped\tthird\\\\segment";

  const auto fields = solid::SplitRecord(line);

  ASSERT_EQ(3u, fields.size());
  EXPECT_EQ("first", fields[0]);
  EXPECT_EQ("second\twith\nescaped", fields[1]);
  EXPECT_EQ("third\\segment", fields[2]);
}

TEST(EscapingTest, SplitRecordKeepsEmptyTrailingField) {
  const auto fields = solid::SplitRecord("SRP\tinfo\tVideo\t\tmessage");

  ASSERT_EQ(5u, fields.size());
  EXPECT_EQ("", fields[3]);
  EXPECT_EQ("message", fields[4]);
}

TEST(EscapingTest, JoinRecordEscapesEachField) {
  EXPECT_EQ("LSP\ta\\\\b\tc\\td", solid::JoinRecord({"LSP", "a\\b", "c\td"}));
}

} // namespace
