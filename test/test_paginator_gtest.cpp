#include <gtest/gtest.h>

#include "resume/Paginator.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace resume;

class PaginatorTest : public ::testing::Test {
protected:
    testutil::FixedWidthMeasurer measurer;
    TextStyle unit;  // size 2 -> every code point is 1 unit wide

    void SetUp() override { unit.size = 2.0; }

    static BoxMetrics box(double height, double before = 0.0, double after = 0.0) {
        BoxMetrics b;
        b.height = height;
        b.space_before = before;
        b.space_after = after;
        b.line_count = 1;
        b.line_height = height;
        return b;
    }

    static BoxMetrics lines_box(size_t lines, double line_height) {
        BoxMetrics b;
        b.line_count = lines;
        b.line_height = line_height;
        b.height = static_cast<double>(lines) * line_height;
        b.splittable = true;
        return b;
    }

    static std::vector<size_t> elements_on(const Page& p) {
        std::vector<size_t> out;
        for (const auto& at : p.placements) out.push_back(at.element);
        return out;
    }
};

// ==================== wrapping ====================

TEST_F(PaginatorTest, WrapBreaksAtSpaces) {
    const auto lines = wrap_text("aaa bbb ccc", 7.0, unit, measurer);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "aaa bbb");
    EXPECT_EQ(lines[1], "ccc");
}

TEST_F(PaginatorTest, WrapCollapsesRepeatedSpaces) {
    const auto lines = wrap_text("  a    b  ", 10.0, unit, measurer);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "a b");
}

TEST_F(PaginatorTest, WrapBreaksLongWordsBetweenCodePoints) {
    const auto lines = wrap_text("x abcdefghij", 4.0, unit, measurer);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "x");
    EXPECT_EQ(lines[1], "abcd");
    EXPECT_EQ(lines[2], "efgh");
    EXPECT_EQ(lines[3], "ij");
}

TEST_F(PaginatorTest, WrapKeepsMultibyteCharactersWhole) {
    const auto lines = wrap_text("\xC3\xA1\xC3\xA9\xC3\xAD", 2.0, unit, measurer);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "\xC3\xA1\xC3\xA9");
    EXPECT_EQ(lines[1], "\xC3\xAD");
}

TEST_F(PaginatorTest, WrapEmptyTextGivesOneEmptyLine) {
    const auto lines = wrap_text("", 10.0, unit, measurer);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "");
}

// ==================== pagination ====================

TEST_F(PaginatorTest, NoElementsStillGivesOnePage) {
    const auto pages = paginate({}, 100.0);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_TRUE(pages[0].placements.empty());
}

TEST_F(PaginatorTest, BreaksWhenNextElementDoesNotFit) {
    const auto pages = paginate({box(40), box(40), box(40), box(40), box(40)}, 100.0);

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(elements_on(pages[0]), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(elements_on(pages[1]), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(elements_on(pages[2]), (std::vector<size_t>{4}));
    EXPECT_DOUBLE_EQ(pages[1].placements[0].y, 0.0);
    EXPECT_DOUBLE_EQ(pages[1].placements[1].y, 40.0);
}

TEST_F(PaginatorTest, ExactFitStaysOnPage) {
    const auto pages = paginate({box(50), box(50)}, 100.0);
    EXPECT_EQ(pages.size(), 1u);
}

TEST_F(PaginatorTest, SpacingIsAppliedBetweenElements) {
    const auto pages = paginate({box(10, 0, 5), box(10, 3, 0)}, 100.0);

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_DOUBLE_EQ(pages[0].placements[1].y, 18.0);
}

TEST_F(PaginatorTest, SpaceBeforeIsDroppedAtTopOfPage) {
    const auto pages = paginate({box(90), box(20, 15)}, 100.0);

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_DOUBLE_EQ(pages[1].placements[0].y, 0.0);
}

TEST_F(PaginatorTest, OversizedParagraphIsSplitBetweenLines) {
    const auto pages = paginate({box(30), lines_box(25, 10.0)}, 100.0);

    ASSERT_EQ(pages.size(), 3u);
    ASSERT_EQ(pages[0].placements.size(), 2u);
    EXPECT_EQ(pages[0].placements[1].first_line, 0u);
    EXPECT_EQ(pages[0].placements[1].line_count, 7u);
    EXPECT_EQ(pages[1].placements[0].first_line, 7u);
    EXPECT_EQ(pages[1].placements[0].line_count, 10u);
    EXPECT_EQ(pages[2].placements[0].first_line, 17u);
    EXPECT_EQ(pages[2].placements[0].line_count, 8u);
}

TEST_F(PaginatorTest, OversizedUnsplittableElementGetsItsOwnPage) {
    BoxMetrics big = box(150);
    big.splittable = false;
    const auto pages = paginate({box(10), big, box(10)}, 100.0);

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(elements_on(pages[1]), (std::vector<size_t>{1}));
    EXPECT_EQ(elements_on(pages[2]), (std::vector<size_t>{2}));
}

TEST_F(PaginatorTest, OrderIsPreservedAcrossPages) {
    std::vector<BoxMetrics> boxes;
    for (int i = 0; i < 50; ++i) boxes.push_back(box(7.0 + (i % 5), 2.0, 1.0));

    const auto pages = paginate(boxes, 60.0);
    size_t expected = 0;
    for (const auto& p : pages) {
        for (const auto& at : p.placements) EXPECT_EQ(at.element, expected++);
    }
    EXPECT_EQ(expected, boxes.size());
}

// ==================== prepared elements ====================

TEST_F(PaginatorTest, TwoColumnRowHeightIsTallerCellPlusPadding) {
    StyleConfig style;
    style.skill_item.size = 2.0;
    style.skill_item.leading = 10.0;
    style.row_padding = 1.0;

    const double cell = two_column_width(style) - measurer.text_width(style.skill_item, kSkillMarker) - kCellRightPadding;
    const size_t cell_chars = static_cast<size_t>(cell);
    const std::string longer(cell_chars * 2 + cell_chars / 2, 'w');

    const std::vector<FlowElement> elements = {TwoColumnRow{"short", longer}};
    const auto prepared = prepare_elements(elements, style, measurer);

    ASSERT_EQ(prepared.size(), 1u);
    EXPECT_EQ(prepared[0].lines.size(), 1u);
    EXPECT_EQ(prepared[0].right_lines.size(), 3u);
    EXPECT_DOUBLE_EQ(prepared[0].box.height, 3 * 10.0 + 2.0);
    EXPECT_FALSE(prepared[0].box.splittable);
}

TEST_F(PaginatorTest, HeaderHasFixedHeight) {
    StyleConfig style;
    const std::vector<FlowElement> elements = {SectionHeaderElement{"EXPERIENCE"}};
    const auto prepared = prepare_elements(elements, style, measurer);

    EXPECT_DOUBLE_EQ(prepared[0].box.height, style.section_header_height);
    EXPECT_FALSE(prepared[0].box.splittable);
}
