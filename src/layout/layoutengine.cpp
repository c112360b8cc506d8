/*
 * layoutengine.cpp --- Layout blocks -> block boxes, and the page-break rule
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutengine.h"
#include "linebreaker.h"

#include <type_traits>

namespace Layout {

// --- Page-break policy ---

int linesFitting(const BlockBox &block, qreal availableHeight)
{
    int count = 0;
    qreal accum = 0;
    for (const LineBox &line : block.lines) {
        accum += line.height;
        if (accum > availableHeight)
            break;
        ++count;
    }
    return count;
}

// Height the next block needs so a keep-with-next block is not stranded:
// its first two lines for text blocks, all of it for rows.
static qreal leadHeight(const BlockBox &next)
{
    switch (next.type) {
    case BlockBox::SeparatorBlock:
        return 0;
    case BlockBox::TableRowBlock:
        return next.spaceBefore + next.height;
    default:
        break;
    }

    qreal h = next.spaceBefore;
    for (int i = 0; i < 2 && i < next.lines.size(); ++i)
        h += next.lines[i].height;
    return h;
}

BreakDecision decideBreak(const BlockBox &block, qreal remaining,
                          bool pageIsEmpty, const BlockBox *next)
{
    if (block.type == BlockBox::SeparatorBlock) {
        // A page break already separates; never open a page with blank space.
        if (pageIsEmpty || block.height > remaining)
            return {BreakAction::Drop, 0};
        return {BreakAction::Place, 0};
    }

    if (block.height <= remaining) {
        if (block.keepWithNext && next && !pageIsEmpty
            && block.height + block.spaceAfter + leadHeight(*next) > remaining) {
            return {BreakAction::MoveToNextPage, 0};
        }
        return {BreakAction::Place, 0};
    }

    const int lineCount = block.lines.size();
    const int fit = linesFitting(block, remaining);

    // height is lines * lineHeight; the line-by-line sum can round lower.
    if (block.type != BlockBox::TableRowBlock && lineCount > 0 && fit >= lineCount)
        return {BreakAction::Place, 0};

    if (pageIsEmpty) {
        // Taller than a whole page: keep as much as possible here.
        if (block.type == BlockBox::TableRowBlock || lineCount <= 1)
            return {BreakAction::Place, 0};
        return {BreakAction::Split, qBound(1, fit, lineCount - 1)};
    }

    if (!block.isSplittable())
        return {BreakAction::MoveToNextPage, 0};

    if (fit >= 2)
        return {BreakAction::Split, fit};
    return {BreakAction::MoveToNextPage, 0};
}

std::pair<BlockBox, BlockBox> splitBlockBoxAt(const BlockBox &block, int lineCount)
{
    const int count = qBound(0, lineCount, int(block.lines.size()));

    BlockBox head = block;
    head.lines = block.lines.mid(0, count);
    head.spaceAfter = 0;
    head.isFragmentEnd = false;
    head.keepWithNext = false;
    head.height = 0;
    for (const LineBox &line : head.lines)
        head.height += line.height;

    BlockBox tail = block;
    tail.lines = block.lines.mid(count);
    tail.spaceBefore = 0;
    tail.isFragmentStart = false;
    tail.height = 0;
    for (const LineBox &line : tail.lines)
        tail.height += line.height;

    return {head, tail};
}

std::optional<std::pair<BlockBox, BlockBox>>
splitBlockBox(const BlockBox &block, qreal availableHeight, int minLines)
{
    if (block.height <= availableHeight)
        return std::nullopt;

    const int fit = linesFitting(block, availableHeight);
    if (fit < minLines || fit >= block.lines.size())
        return std::nullopt;

    return splitBlockBoxAt(block, fit);
}

// --- Layout Engine ---

Engine::Engine(const Typography &typography, const TextMeasurer &measurer)
    : m_typography(typography)
    , m_measurer(measurer)
{
}

QList<BlockBox> Engine::layout(const QList<Content::LayoutBlock> &blocks,
                               qreal availWidth) const
{
    QList<BlockBox> boxes;
    boxes.reserve(blocks.size());
    for (const Content::LayoutBlock &block : blocks)
        boxes.append(layoutBlock(block, availWidth));
    return boxes;
}

BlockBox Engine::layoutBlock(const Content::LayoutBlock &block, qreal availWidth) const
{
    return std::visit([&](const auto &b) -> BlockBox {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Content::Heading>)
            return layoutHeading(b, availWidth);
        else if constexpr (std::is_same_v<T, Content::Paragraph>)
            return layoutParagraph(b, availWidth);
        else if constexpr (std::is_same_v<T, Content::ListItem>)
            return layoutListItem(b, availWidth);
        else if constexpr (std::is_same_v<T, Content::TableRow>)
            return layoutTableRow(b, availWidth);
        else
            return layoutSeparator(b, availWidth);
    }, block);
}

QStringList Engine::wrap(const QString &text, const Render::FontSpec &font,
                         qreal availWidth) const
{
    return LineBreaking::wrapText(text, availWidth, [this, &font](const QString &candidate) {
        return m_measurer.width(candidate, font);
    });
}

QList<LineBox> Engine::breakIntoLines(const QString &text, const Render::FontSpec &font,
                                      qreal lineHeight, qreal availWidth, qreal x) const
{
    QList<LineBox> lines;
    const QStringList wrapped = wrap(text, font, availWidth);
    for (const QString &line : wrapped)
        lines.append(LineBox{line, x, lineHeight});
    return lines;
}

BlockBox Engine::layoutHeading(const Content::Heading &heading, qreal availWidth) const
{
    const TextRole &role = m_typography.headingRole(heading.level);

    BlockBox box;
    box.type = BlockBox::HeadingBlock;
    box.headingLevel = heading.level;
    box.keepWithNext = true;
    box.width = availWidth;
    box.font = role.font;
    box.color = role.color;
    box.lineHeight = role.lineHeight;
    box.spaceBefore = role.spaceBefore;
    box.spaceAfter = role.spaceAfter;
    box.lines = breakIntoLines(heading.text, role.font, role.lineHeight, availWidth);
    box.height = box.lines.size() * role.lineHeight;
    return box;
}

BlockBox Engine::layoutParagraph(const Content::Paragraph &para, qreal availWidth) const
{
    const TextRole &role = m_typography.body;

    BlockBox box;
    box.type = BlockBox::ParagraphBlock;
    box.width = availWidth;
    box.font = role.font;
    box.font.italic = box.font.italic || para.pending;
    box.color = para.pending ? m_typography.pendingColor : role.color;
    box.lineHeight = role.lineHeight;
    box.spaceBefore = role.spaceBefore;
    box.spaceAfter = role.spaceAfter;
    box.lines = breakIntoLines(para.text, box.font, role.lineHeight, availWidth);
    box.height = box.lines.size() * role.lineHeight;
    return box;
}

BlockBox Engine::layoutListItem(const Content::ListItem &item, qreal availWidth) const
{
    const TextRole &role = m_typography.body;
    const qreal indent = m_typography.listIndent;

    BlockBox box;
    box.type = BlockBox::ListItemBlock;
    box.width = availWidth;
    box.font = role.font;
    box.font.italic = box.font.italic || item.pending;
    box.color = item.pending ? m_typography.pendingColor : role.color;
    box.lineHeight = role.lineHeight;
    box.spaceBefore = role.spaceBefore;
    box.spaceAfter = role.spaceAfter;
    box.checkbox = item.checkbox;
    if (!item.checkbox) {
        box.marker = item.ordinal ? QStringLiteral("%1.").arg(*item.ordinal)
                                  : QString(QChar(0x2022));
    }
    box.lines = breakIntoLines(item.text, box.font, role.lineHeight,
                               availWidth - indent, indent);
    box.height = box.lines.size() * role.lineHeight;
    return box;
}

BlockBox Engine::layoutTableRow(const Content::TableRow &row, qreal availWidth) const
{
    const TextRole &role = m_typography.tableText;
    const qreal padding = m_typography.cellPadding;
    const int columns = qMax(1, int(row.cells.size()));
    const qreal columnWidth = availWidth / columns;

    BlockBox box;
    box.type = BlockBox::TableRowBlock;
    box.width = availWidth;
    box.font = role.font;
    box.font.bold = box.font.bold || row.isHeader;
    box.color = role.color;
    box.lineHeight = role.lineHeight;
    box.isHeaderRow = row.isHeader;
    box.keepWithNext = row.isHeader;
    box.cellPadding = padding;
    box.borderColor = m_typography.tableBorderColor;
    box.borderWidth = m_typography.tableBorderWidth;
    if (row.isHeader)
        box.background = m_typography.tableHeaderBackground;

    int maxLines = 1;
    for (int i = 0; i < row.cells.size(); ++i) {
        const bool pending = row.pending.value(i, false);
        TableCellBox cell;
        cell.x = i * columnWidth;
        cell.width = columnWidth;
        cell.font = box.font;
        cell.font.italic = cell.font.italic || pending;
        cell.color = pending ? m_typography.pendingColor : box.color;
        cell.lines = breakIntoLines(row.cells[i], cell.font, role.lineHeight,
                                    columnWidth - 2 * padding, padding);
        maxLines = qMax(maxLines, int(cell.lines.size()));
        box.cells.append(cell);
    }

    box.height = maxLines * role.lineHeight + 2 * padding;
    return box;
}

BlockBox Engine::layoutSeparator(const Content::Separator &sep, qreal availWidth) const
{
    BlockBox box;
    box.type = BlockBox::SeparatorBlock;
    box.width = availWidth;
    box.rule = sep.rule;
    box.ruleColor = m_typography.ruleColor;
    box.height = sep.rule ? m_typography.ruleHeight : m_typography.spacerHeight;
    return box;
}

} // namespace Layout
