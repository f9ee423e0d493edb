#include "../../src/common/source.hpp"

#include <gtest/gtest.h>

using namespace tally;

TEST(SourceTest, LineCountIgnoresTrailingNewline) {
    EXPECT_EQ(Source("").line_count(), 0u);
    EXPECT_EQ(Source("a").line_count(), 1u);
    EXPECT_EQ(Source("a\n").line_count(), 1u);
    EXPECT_EQ(Source("a\nb\n").line_count(), 2u);
    EXPECT_EQ(Source("a\nb").line_count(), 2u);
    EXPECT_EQ(Source("\n\n\n").line_count(), 3u);
}

TEST(SourceTest, LineColumnIsOneIndexed) {
    Source src("int x;\nfoo bar;\n", "a.cm");
    auto first = src.get_line_column(0);
    EXPECT_EQ(first.line, 1u);
    EXPECT_EQ(first.column, 1u);

    auto bar = src.get_line_column(11);
    EXPECT_EQ(bar.line, 2u);
    EXPECT_EQ(bar.column, 5u);
}

TEST(SourceTest, OffsetPastEndIsClamped) {
    Source src("ab\ncd");
    auto loc = src.get_line_column(100);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 3u);
}

TEST(SourceTest, GetLineStripsNewline) {
    Source src("first\r\nsecond\nthird");
    EXPECT_EQ(src.get_line(1), "first");
    EXPECT_EQ(src.get_line(2), "second");
    EXPECT_EQ(src.get_line(3), "third");
    EXPECT_EQ(src.get_line(0), "");
    EXPECT_EQ(src.get_line(9), "");
}

TEST(SourceTest, LocateResolvesSpan) {
    Source src("var a = 1;\nvar b = a + c;\n", "lib/x.dart");
    auto loc = src.locate(Span{23, 24});
    EXPECT_TRUE(loc.is_resolved());
    EXPECT_EQ(loc.file, "lib/x.dart");
    EXPECT_EQ(loc.begin.line, 2u);
    EXPECT_EQ(loc.begin.column, 13u);
    EXPECT_EQ(loc.end.column, 14u);
    EXPECT_EQ(loc.line_text, "var b = a + c;");
    EXPECT_EQ(src.get_text(loc.span), "c");
}
