#include <gtest/gtest.h>

#include "tq/parser/quick_syntax.hpp"

using namespace tq::parser;

class QuickSyntaxTest : public ::testing::Test {};

TEST_F(QuickSyntaxTest, DescriptionAfterSeparator) {
  auto slashes = QuickSyntax::description("Plan trip // book flights first");
  ASSERT_TRUE(slashes.has_value());
  EXPECT_EQ(slashes->value, "book flights first");
  EXPECT_EQ(slashes->spans[0].position, 9u);

  auto dashes = QuickSyntax::description("Fix bug -- see the crash log");
  ASSERT_TRUE(dashes.has_value());
  EXPECT_EQ(dashes->value, "see the crash log");

  auto pipe = QuickSyntax::description("Email Ana | about the invoice");
  ASSERT_TRUE(pipe.has_value());
  EXPECT_EQ(pipe->value, "about the invoice");
}

TEST_F(QuickSyntaxTest, DescriptionNeedsSurroundingSpaces) {
  EXPECT_FALSE(QuickSyntax::description("Check http://example.com").has_value());
  EXPECT_FALSE(QuickSyntax::description("Plan A|B").has_value());
}

TEST_F(QuickSyntaxTest, EffortHoursAndMinutes) {
  auto combined = QuickSyntax::effort("Write essay ~1h30m");
  ASSERT_TRUE(combined.has_value());
  EXPECT_DOUBLE_EQ(combined->value, 1.5);
  EXPECT_EQ(combined->rule, "effort-hours");
  EXPECT_EQ(combined->matched, "~1h30m");

  auto fractional = QuickSyntax::effort("Refactor ~2.5h");
  ASSERT_TRUE(fractional.has_value());
  EXPECT_DOUBLE_EQ(fractional->value, 2.5);

  auto words = QuickSyntax::effort("Move boxes effort: 2 hours");
  ASSERT_TRUE(words.has_value());
  EXPECT_DOUBLE_EQ(words->value, 2.0);
}

TEST_F(QuickSyntaxTest, EffortMinutesOnly) {
  auto minutes = QuickSyntax::effort("Call bank est: 45m");
  ASSERT_TRUE(minutes.has_value());
  EXPECT_DOUBLE_EQ(minutes->value, 0.75);
  EXPECT_EQ(minutes->rule, "effort-minutes");

  auto upper = QuickSyntax::effort("Stretch ~15 MIN");
  ASSERT_TRUE(upper.has_value());
  EXPECT_DOUBLE_EQ(upper->value, 0.25);
}

TEST_F(QuickSyntaxTest, NoEffortWithoutMarker) {
  EXPECT_FALSE(QuickSyntax::effort("Run 5h").has_value());
}

TEST_F(QuickSyntaxTest, TagsInOrderWithoutDuplicates) {
  const std::string buffer = "Buy #\"home office\" supplies #errands #errands";
  auto tags = QuickSyntax::tags(buffer);
  ASSERT_TRUE(tags.has_value());
  EXPECT_EQ(tags->value, (std::vector<std::string>{"home office", "errands"}));
  ASSERT_EQ(tags->spans.size(), 3u);
  EXPECT_EQ(tags->spans[0].position, buffer.find("#\"home"));
  EXPECT_EQ(tags->matched, "#\"home office\" #errands #errands");
}

TEST_F(QuickSyntaxTest, HyphenatedTag) {
  auto tags = QuickSyntax::tags("Email client #follow-up");
  ASSERT_TRUE(tags.has_value());
  EXPECT_EQ(tags->value, (std::vector<std::string>{"follow-up"}));
}

TEST_F(QuickSyntaxTest, FolderQuotedBeforeBare) {
  auto quoted = QuickSyntax::folder("Sketch logo @\"side project\" @work");
  ASSERT_TRUE(quoted.has_value());
  EXPECT_EQ(quoted->value, "side project");
  EXPECT_EQ(quoted->rule, "folder-quoted");

  auto bare = QuickSyntax::folder("Sketch logo @work");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->value, "work");
  EXPECT_EQ(bare->rule, "folder");
}

TEST_F(QuickSyntaxTest, FolderMarkerInsideEmailAddress) {
  auto folder = QuickSyntax::folder("Reply to bob@example.com");
  ASSERT_TRUE(folder.has_value());
  EXPECT_EQ(folder->value, "example");
}

TEST_F(QuickSyntaxTest, Detect) {
  EXPECT_TRUE(QuickSyntax::detect("Buy milk #errands"));
  EXPECT_TRUE(QuickSyntax::detect("Buy milk @home"));
  EXPECT_TRUE(QuickSyntax::detect("Buy milk ~10m"));
  EXPECT_TRUE(QuickSyntax::detect("Buy milk // oat"));
  EXPECT_FALSE(QuickSyntax::detect("Buy milk"));
}
