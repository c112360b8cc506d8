/*
 * layoutengine.h --- Layout blocks -> block boxes, and the page-break rule
 *
 * The engine measures and wraps each Content::LayoutBlock into a BlockBox
 * of fixed-height lines. decideBreak() is the per-block pagination policy
 * used by the page assembler:
 *
 *   - a block that fits is placed where it is;
 *   - a heading, list item, table row or other single unit that does not
 *     fit starts a new page;
 *   - a paragraph that does not fit is split when at least two of its
 *     lines fit, and moved whole to the next page otherwise.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_LAYOUTENGINE_H
#define REPORTPRESS_LAYOUTENGINE_H

#include <QColor>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

#include "contentmodel.h"
#include "textmeasurer.h"
#include "typography.h"

namespace Layout {

// --- Box tree ---

struct LineBox {
    QString text;
    qreal x = 0;       // offset from the block's left edge
    qreal height = 0;
};

struct TableCellBox {
    QList<LineBox> lines;
    qreal x = 0;       // offset from the row's left edge
    qreal width = 0;
    Render::FontSpec font;
    QColor color;
};

struct BlockBox {
    enum Type { ParagraphBlock, HeadingBlock, ListItemBlock, TableRowBlock, SeparatorBlock };
    Type type = ParagraphBlock;

    QList<LineBox> lines;
    qreal width = 0;
    qreal height = 0;
    qreal spaceBefore = 0;   // skipped at the top of a page
    qreal spaceAfter = 0;
    qreal lineHeight = 0;
    Render::FontSpec font;
    QColor color;

    int headingLevel = 0;
    bool keepWithNext = false; // headings and table header rows

    // List item
    QString marker;            // bullet or "N."; empty for checkbox items
    bool checkbox = false;

    // Table row
    QList<TableCellBox> cells;
    bool isHeaderRow = false;
    qreal cellPadding = 0;
    QColor background;         // invalid = none
    QColor borderColor;
    qreal borderWidth = 0;

    // Separator
    bool rule = false;
    QColor ruleColor;

    // Fragment flags for blocks split across pages
    bool isFragmentStart = true;
    bool isFragmentEnd = true;

    // Only paragraphs may be split to fill the bottom of a page.
    bool isSplittable() const { return type == ParagraphBlock; }
};

// --- Page-break policy ---

enum class BreakAction {
    Place,           // draw the whole block at the cursor
    Split,           // draw linesOnPage lines here, the rest on a new page
    MoveToNextPage,  // start a new page, then decide again
    Drop,            // nothing to draw (separator at a page boundary)
};

struct BreakDecision {
    BreakAction action = BreakAction::Place;
    int linesOnPage = 0;
};

// Number of leading lines of @p block that fit within @p availableHeight.
int linesFitting(const BlockBox &block, qreal availableHeight);

// @p remaining excludes the block's spaceBefore. On an empty page the
// decision never moves the block again, so layout always terminates.
BreakDecision decideBreak(const BlockBox &block, qreal remaining,
                          bool pageIsEmpty, const BlockBox *next = nullptr);

// Split after @p lineCount lines (1 <= lineCount < lines.size()).
std::pair<BlockBox, BlockBox> splitBlockBoxAt(const BlockBox &block, int lineCount);

// Split a block at a line boundary to fit within availableHeight.
// Returns nullopt if the block fits already or fewer than minLines fit.
std::optional<std::pair<BlockBox, BlockBox>>
splitBlockBox(const BlockBox &block, qreal availableHeight, int minLines = 2);

// --- Layout Engine ---

class Engine {
public:
    Engine(const Typography &typography, const TextMeasurer &measurer);

    QList<BlockBox> layout(const QList<Content::LayoutBlock> &blocks, qreal availWidth) const;
    BlockBox layoutBlock(const Content::LayoutBlock &block, qreal availWidth) const;

    QStringList wrap(const QString &text, const Render::FontSpec &font,
                     qreal availWidth) const;

private:
    BlockBox layoutHeading(const Content::Heading &heading, qreal availWidth) const;
    BlockBox layoutParagraph(const Content::Paragraph &para, qreal availWidth) const;
    BlockBox layoutListItem(const Content::ListItem &item, qreal availWidth) const;
    BlockBox layoutTableRow(const Content::TableRow &row, qreal availWidth) const;
    BlockBox layoutSeparator(const Content::Separator &sep, qreal availWidth) const;

    QList<LineBox> breakIntoLines(const QString &text, const Render::FontSpec &font,
                                  qreal lineHeight, qreal availWidth, qreal x = 0) const;

    const Typography &m_typography;
    const TextMeasurer &m_measurer;
};

} // namespace Layout

#endif // REPORTPRESS_LAYOUTENGINE_H
