#include "commentmap/core/span_info.hpp"
#include <gtest/gtest.h>

namespace commentmap {

class SpanInfoTest : public ::testing::Test {
protected:
    // fn body from "{" on line 4 to "}" on line 10
    SpanInfo block_{.start_line = 4,
                    .start_column = 9,
                    .end_line = 10,
                    .end_column = 10,
                    .start_offset = 0,
                    .end_offset = 0};
};

TEST_F(SpanInfoTest, FallbackSpanIsPointAtFileStart)
{
    auto span = fallback_span();

    EXPECT_EQ(span.start_line, 1);
    EXPECT_EQ(span.start_column, 0);
    EXPECT_TRUE(is_point(span));
    EXPECT_TRUE(is_well_formed(span));
    EXPECT_EQ(span.start_offset, 0);
    EXPECT_EQ(span.end_offset, 0);
}

TEST_F(SpanInfoTest, PositionsCompareByLineThenColumn)
{
    EXPECT_LT((SourcePosition{.line = 1, .column = 40}), (SourcePosition{.line = 2, .column = 0}));
    EXPECT_LT((SourcePosition{.line = 3, .column = 2}), (SourcePosition{.line = 3, .column = 5}));
    EXPECT_EQ((SourcePosition{.line = 3, .column = 5}), (SourcePosition{.line = 3, .column = 5}));
}

TEST_F(SpanInfoTest, WellFormedRequiresEndNotBeforeStart)
{
    EXPECT_TRUE(is_well_formed(block_));
    EXPECT_FALSE(is_well_formed(make_span({.line = 3, .column = 4}, {.line = 2, .column = 9})));
    EXPECT_FALSE(is_well_formed(make_span({.line = 3, .column = 4}, {.line = 3, .column = 1})));
    EXPECT_FALSE(is_well_formed(make_span({.line = 0, .column = 0}, {.line = 1, .column = 0})));
}

TEST_F(SpanInfoTest, ContainsPositionIsHalfOpen)
{
    EXPECT_TRUE(contains_position(block_, {.line = 4, .column = 9}));
    EXPECT_TRUE(contains_position(block_, {.line = 7, .column = 0}));
    EXPECT_TRUE(contains_position(block_, {.line = 10, .column = 9}));
    EXPECT_FALSE(contains_position(block_, {.line = 10, .column = 10}));
    EXPECT_FALSE(contains_position(block_, {.line = 4, .column = 8}));
    EXPECT_FALSE(contains_position(block_, {.line = 11, .column = 0}));
}

TEST_F(SpanInfoTest, ContainsSpanIncludesBoundaries)
{
    EXPECT_TRUE(contains_span(block_, block_));
    EXPECT_TRUE(contains_span(block_, make_span({.line = 5, .column = 4}, {.line = 5, .column = 20})));
    EXPECT_FALSE(
        contains_span(block_, make_span({.line = 10, .column = 11}, {.line = 10, .column = 30})));
    EXPECT_FALSE(contains_span(block_, make_span({.line = 3, .column = 0}, {.line = 5, .column = 0})));
}

TEST_F(SpanInfoTest, ExtentsMeasureLinesAndColumns)
{
    EXPECT_EQ(line_extent(block_), 6);
    EXPECT_EQ(column_extent(block_), 1);

    auto single = make_span({.line = 2, .column = 3}, {.line = 2, .column = 6});
    EXPECT_EQ(line_extent(single), 0);
    EXPECT_EQ(column_extent(single), 3);

    // End column left of start column on a later line
    auto wrapped = make_span({.line = 1, .column = 5}, {.line = 2, .column = 3});
    EXPECT_EQ(column_extent(wrapped), 0);
}

TEST_F(SpanInfoTest, SpanLessOrdersByStartThenEnd)
{
    auto early = make_span({.line = 2, .column = 3}, {.line = 2, .column = 6});
    auto late = make_span({.line = 2, .column = 7}, {.line = 2, .column = 8});
    auto longer = make_span({.line = 2, .column = 3}, {.line = 5, .column = 0});

    EXPECT_TRUE(span_less(early, late));
    EXPECT_FALSE(span_less(late, early));
    EXPECT_TRUE(span_less(early, longer));
    EXPECT_FALSE(span_less(early, early));
}

TEST_F(SpanInfoTest, FormatSpan)
{
    EXPECT_EQ(format_span(make_span({.line = 3, .column = 9}, {.line = 3, .column = 18})),
              "3:9-3:18");
    EXPECT_EQ(format_span(block_), "4:9-10:10");
}

} // namespace commentmap
