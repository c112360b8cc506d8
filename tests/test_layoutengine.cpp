/*
 * test_layoutengine.cpp --- Block layout and the page-break policy
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "layoutengine.h"
#include "testutils.h"

using Layout::BlockBox;
using Layout::BreakAction;

static BlockBox paragraphBox(int lineCount, qreal lineHeight = 18.0)
{
    BlockBox box;
    box.type = BlockBox::ParagraphBlock;
    box.lineHeight = lineHeight;
    for (int i = 0; i < lineCount; ++i)
        box.lines.append(Layout::LineBox{QStringLiteral("line %1").arg(i + 1), 0, lineHeight});
    box.height = lineCount * lineHeight;
    return box;
}

static BlockBox headingBox()
{
    BlockBox box = paragraphBox(1);
    box.type = BlockBox::HeadingBlock;
    box.keepWithNext = true;
    return box;
}

// MARK: - Break decisions

TEST(BreakPolicyTest, BlockThatFitsIsPlaced) {
    const auto d = Layout::decideBreak(paragraphBox(3), 54.0, false);
    EXPECT_EQ(d.action, BreakAction::Place);
}

TEST(BreakPolicyTest, ParagraphWithRoomForOneLineMovesWhole) {
    const auto d = Layout::decideBreak(paragraphBox(5), 18.0, false);
    EXPECT_EQ(d.action, BreakAction::MoveToNextPage);
}

TEST(BreakPolicyTest, ParagraphWithRoomForThreeLinesSplitsThreeTwo) {
    const BlockBox block = paragraphBox(5);
    const auto d = Layout::decideBreak(block, 3 * 18.0 + 5.0, false);
    ASSERT_EQ(d.action, BreakAction::Split);
    EXPECT_EQ(d.linesOnPage, 3);

    const auto [head, tail] = Layout::splitBlockBoxAt(block, d.linesOnPage);
    EXPECT_EQ(head.lines.size(), 3);
    EXPECT_EQ(tail.lines.size(), 2);
    EXPECT_DOUBLE_EQ(head.height, 54.0);
    EXPECT_DOUBLE_EQ(tail.height, 36.0);
    EXPECT_TRUE(head.isFragmentStart);
    EXPECT_FALSE(head.isFragmentEnd);
    EXPECT_FALSE(tail.isFragmentStart);
    EXPECT_EQ(tail.lines.first().text, QStringLiteral("line 4"));
}

TEST(BreakPolicyTest, TwoFittingLinesAreEnoughToSplit) {
    const auto d = Layout::decideBreak(paragraphBox(4), 36.0, false);
    ASSERT_EQ(d.action, BreakAction::Split);
    EXPECT_EQ(d.linesOnPage, 2);
}

TEST(BreakPolicyTest, AtomicBlocksMoveInsteadOfSplitting) {
    BlockBox item = paragraphBox(3);
    item.type = BlockBox::ListItemBlock;
    EXPECT_EQ(Layout::decideBreak(item, 40.0, false).action, BreakAction::MoveToNextPage);

    BlockBox row = paragraphBox(0);
    row.type = BlockBox::TableRowBlock;
    row.height = 30.0;
    EXPECT_EQ(Layout::decideBreak(row, 20.0, false).action, BreakAction::MoveToNextPage);
}

TEST(BreakPolicyTest, HeadingIsKeptWithItsNextBlock) {
    const BlockBox heading = headingBox();
    const BlockBox body = paragraphBox(4);

    // Heading fits, but only one line of the paragraph would follow it.
    const auto d = Layout::decideBreak(heading, 18.0 + 18.0, false, &body);
    EXPECT_EQ(d.action, BreakAction::MoveToNextPage);

    // Two lines of the paragraph fit after it.
    EXPECT_EQ(Layout::decideBreak(heading, 18.0 * 3, false, &body).action, BreakAction::Place);

    // Nothing more can be gained on a fresh page.
    EXPECT_EQ(Layout::decideBreak(heading, 18.0, true, &body).action, BreakAction::Place);
}

TEST(BreakPolicyTest, SeparatorsAreDroppedAtPageBoundaries) {
    BlockBox sep;
    sep.type = BlockBox::SeparatorBlock;
    sep.height = 16.0;
    EXPECT_EQ(Layout::decideBreak(sep, 500.0, true).action, BreakAction::Drop);
    EXPECT_EQ(Layout::decideBreak(sep, 10.0, false).action, BreakAction::Drop);
    EXPECT_EQ(Layout::decideBreak(sep, 20.0, false).action, BreakAction::Place);
}

TEST(BreakPolicyTest, OversizeBlockOnEmptyPageStillProgresses) {
    const auto d = Layout::decideBreak(paragraphBox(10), 18.0 * 4, true);
    ASSERT_EQ(d.action, BreakAction::Split);
    EXPECT_EQ(d.linesOnPage, 4);

    // Not even one line fits: one line is placed anyway.
    const auto tiny = Layout::decideBreak(paragraphBox(3), 5.0, true);
    ASSERT_EQ(tiny.action, BreakAction::Split);
    EXPECT_EQ(tiny.linesOnPage, 1);
}

TEST(BreakPolicyTest, BlockWhoseLinesAllFitIsPlacedDespiteRounding) {
    // 7 * 12.6 rounds above 12.6 added seven times.
    const BlockBox block = paragraphBox(7, 12.6);
    qreal summed = 0;
    for (const Layout::LineBox &line : block.lines)
        summed += line.height;

    EXPECT_EQ(Layout::decideBreak(block, summed, false).action, BreakAction::Place);
    EXPECT_EQ(Layout::decideBreak(block, summed, true).action, BreakAction::Place);
}

TEST(BreakPolicyTest, SplitBlockBoxHonoursMinimumLines) {
    EXPECT_FALSE(Layout::splitBlockBox(paragraphBox(3), 60.0).has_value());
    EXPECT_FALSE(Layout::splitBlockBox(paragraphBox(5), 20.0).has_value());

    const auto split = Layout::splitBlockBox(paragraphBox(5), 40.0);
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first.lines.size(), 2);
    EXPECT_EQ(split->second.lines.size(), 3);
}

// MARK: - Engine

class LayoutEngineTest : public ::testing::Test {
protected:
    Typography typography = Typography::preset();
    FixedWidthMeasurer measurer;
    Layout::Engine engine{typography, measurer};
};

TEST_F(LayoutEngineTest, ParagraphWrapsToAvailableWidth) {
    // 60pt = ten characters at 6pt each.
    const BlockBox box = engine.layoutBlock(
        Content::Paragraph{QStringLiteral("aaaa bbbb cccc dddd"), false}, 60.0);
    ASSERT_EQ(box.lines.size(), 2);
    EXPECT_EQ(box.lines[0].text, QStringLiteral("aaaa bbbb"));
    EXPECT_DOUBLE_EQ(box.height, 2 * typography.body.lineHeight);
    EXPECT_TRUE(box.isSplittable());
}

TEST_F(LayoutEngineTest, PendingTextIsItalicInPendingColour) {
    const BlockBox box = engine.layoutBlock(
        Content::Paragraph{QStringLiteral("[Pending Input]"), true}, 400.0);
    EXPECT_TRUE(box.font.italic);
    EXPECT_EQ(box.color, typography.pendingColor);
}

TEST_F(LayoutEngineTest, HeadingsUseTheirRoleAndKeepWithNext) {
    const BlockBox h1 = engine.layoutBlock(Content::Heading{1, QStringLiteral("Risk Matrix")}, 400.0);
    const BlockBox h2 = engine.layoutBlock(Content::Heading{2, QStringLiteral("Acme LLC")}, 400.0);
    EXPECT_EQ(h1.type, BlockBox::HeadingBlock);
    EXPECT_TRUE(h1.keepWithNext);
    EXPECT_DOUBLE_EQ(h1.font.size, typography.heading1.font.size);
    EXPECT_DOUBLE_EQ(h2.font.size, typography.heading2.font.size);
    EXPECT_FALSE(h1.isSplittable());
}

TEST_F(LayoutEngineTest, ListItemsAreIndentedBehindTheirMarker) {
    Content::ListItem item;
    item.text = QStringLiteral("Renew license");
    item.ordinal = 3;
    const BlockBox box = engine.layoutBlock(item, 400.0);
    EXPECT_EQ(box.marker, QStringLiteral("3."));
    ASSERT_EQ(box.lines.size(), 1);
    EXPECT_DOUBLE_EQ(box.lines[0].x, typography.listIndent);

    Content::ListItem check;
    check.text = QStringLiteral("EIN letter");
    check.checkbox = true;
    const BlockBox checkBox = engine.layoutBlock(check, 400.0);
    EXPECT_TRUE(checkBox.checkbox);
    EXPECT_TRUE(checkBox.marker.isEmpty());
}

TEST_F(LayoutEngineTest, TableRowsSplitWidthEquallyAndGrowWithTallestCell) {
    Content::TableRow row;
    row.cells = {QStringLiteral("Late filing"),
                 QStringLiteral("High"),
                 QStringLiteral("Medium"),
                 QStringLiteral("Calendar the deadline and file early")};
    // 4 columns of 100pt; 92pt of text room per cell = 15 characters.
    const BlockBox box = engine.layoutBlock(row, 400.0);

    ASSERT_EQ(box.cells.size(), 4);
    EXPECT_DOUBLE_EQ(box.cells[1].x, 100.0);
    EXPECT_DOUBLE_EQ(box.cells[3].width, 100.0);
    const int tallest = box.cells[3].lines.size();
    EXPECT_GT(tallest, 1);
    EXPECT_DOUBLE_EQ(box.height,
                     tallest * typography.tableText.lineHeight + 2 * typography.cellPadding);
    EXPECT_FALSE(box.keepWithNext);

    row.isHeader = true;
    const BlockBox header = engine.layoutBlock(row, 400.0);
    EXPECT_TRUE(header.keepWithNext);
    EXPECT_TRUE(header.font.bold);
    EXPECT_TRUE(header.background.isValid());
}

TEST_F(LayoutEngineTest, PendingTableCellsUsePendingStyle) {
    Content::TableRow row;
    row.cells = {QStringLiteral("Register agent"), QStringLiteral("[Pending Input]")};
    row.pending = {false, true};
    const BlockBox box = engine.layoutBlock(row, 400.0);

    ASSERT_EQ(box.cells.size(), 2);
    EXPECT_FALSE(box.cells[0].font.italic);
    EXPECT_EQ(box.cells[0].color, typography.tableText.color);
    EXPECT_TRUE(box.cells[1].font.italic);
    EXPECT_EQ(box.cells[1].color, typography.pendingColor);
}

TEST_F(LayoutEngineTest, SeparatorHeightDependsOnRule) {
    EXPECT_DOUBLE_EQ(engine.layoutBlock(Content::Separator{true}, 400.0).height,
                     typography.ruleHeight);
    EXPECT_DOUBLE_EQ(engine.layoutBlock(Content::Separator{false}, 400.0).height,
                     typography.spacerHeight);
}
