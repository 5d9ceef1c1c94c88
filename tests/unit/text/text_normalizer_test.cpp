#include <gtest/gtest.h>

#include <string>

#include "docsage_core/text/text_normalizer.hpp"

namespace docsage_core {

TEST(TextNormalizerTest, LeavesCleanTextUntouched) {
  const std::string text = "Plain text.\n\nSecond paragraph with unicode: caf\xC3\xA9.";
  EXPECT_EQ(TextNormalizer::normalize(text), text);
}

TEST(TextNormalizerTest, ControlWhitespaceBecomesSpaces) {
  const std::string text = std::string("a\tb\vc\fd") + '\0' + "e";
  EXPECT_EQ(TextNormalizer::normalize(text), "a b c d e");
}

TEST(TextNormalizerTest, CarriageReturns) {
  EXPECT_EQ(TextNormalizer::normalize("line1\r\nline2"), "line1 \nline2");
  EXPECT_EQ(TextNormalizer::normalize("line1\rline2"), "line1\nline2");
  EXPECT_EQ(TextNormalizer::normalize("end\r"), "end\n");
}

TEST(TextNormalizerTest, NoBreakSpaceBecomesTwoSpaces) {
  EXPECT_EQ(TextNormalizer::normalize("a\xC2\xA0" "b"), "a  b");
}

TEST(TextNormalizerTest, PreservesLengthForValidUtf8) {
  const std::string text = "x\r\ny\tz\xC2\xA0w\rq";
  EXPECT_EQ(TextNormalizer::normalize(text).size(), text.size());
}

TEST(TextNormalizerTest, ReplacesInvalidUtf8) {
  const std::string text = "ok\xFF" "done";
  const std::string normalized = TextNormalizer::normalize(text);
  EXPECT_EQ(normalized, "ok\xEF\xBF\xBD" "done");
}

TEST(TextNormalizerTest, IsIdempotent) {
  const std::string text = "a\r\nb\tc\xC2\xA0" "d\xFE";
  const std::string once = TextNormalizer::normalize(text);
  EXPECT_EQ(TextNormalizer::normalize(once), once);
}

TEST(TextNormalizerTest, EmptyInput) {
  EXPECT_EQ(TextNormalizer::normalize(""), "");
}

}  // namespace docsage_core
