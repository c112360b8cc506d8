/*
 * pageassembler.cpp --- Two-pass page assembly
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageassembler.h"
#include "pagerecorder.h"
#include "typography.h"

#include <QDebug>

PageAssembler::PageAssembler(const Typography &typography,
                             const Layout::TextMeasurer &measurer)
    : m_typography(typography)
    , m_measurer(measurer)
{
}

qreal PageAssembler::baselineFor(qreal top, qreal lineHeight, qreal fontSize)
{
    return top + (lineHeight + fontSize * 0.7) / 2.0;
}

Render::PageDocument PageAssembler::assemble(const QList<Content::LayoutBlock> &blocks,
                                             const DrawingContext &context,
                                             const HeaderInfo &header) const
{
    Layout::Engine engine(m_typography, m_measurer);
    return assembleBoxes(engine.layout(blocks, m_typography.page.contentWidth()),
                         context, header);
}

Render::PageDocument PageAssembler::assembleBoxes(const QList<Layout::BlockBox> &boxes,
                                                  const DrawingContext &context,
                                                  const HeaderInfo &header) const
{
    if (!context.isValid()) {
        qWarning() << "PageAssembler: refusing to assemble without a drawing backend:"
                   << context.errorString;
        return {};
    }

    Render::PageRecorder recorder(m_typography.page.pageSizePoints());
    const qreal contentBottom = m_typography.page.contentRect().bottom();

    PageMetadata meta;
    meta.brandLine = header.brandLine;
    meta.title = header.title;
    meta.generatedAt = header.generatedAt;
    meta.checksum = header.checksum;

    // --- Pass 1: flow blocks, headers as pages open ---

    PageState state;
    startPage(recorder, state, context, meta);

    for (int i = 0; i < boxes.size(); ++i) {
        Layout::BlockBox block = boxes[i];
        const Layout::BlockBox *next = (i + 1 < boxes.size()) ? &boxes[i + 1] : nullptr;

        for (;;) {
            const bool pageIsEmpty = state.isEmpty();
            const qreal before = pageIsEmpty ? 0 : block.spaceBefore;
            const qreal remaining = contentBottom - state.cursorY - before;
            const Layout::BreakDecision decision =
                Layout::decideBreak(block, remaining, pageIsEmpty, next);

            if (decision.action == Layout::BreakAction::Drop)
                break;

            if (decision.action == Layout::BreakAction::MoveToNextPage) {
                startPage(recorder, state, context, meta);
                continue;
            }

            state.cursorY += before;

            if (decision.action == Layout::BreakAction::Split) {
                auto [head, tail] = Layout::splitBlockBoxAt(block, decision.linesOnPage);
                drawBlock(recorder, head, state.cursorY);
                ++state.blocksOnPage;
                startPage(recorder, state, context, meta);
                block = tail;
                continue;
            }

            drawBlock(recorder, block, state.cursorY);
            state.cursorY += block.height + block.spaceAfter;
            ++state.blocksOnPage;
            break;
        }
    }

    // --- Pass 2: footers, now that the page count is final ---

    stampFooters(recorder, meta);
    return recorder.takeDocument();
}

void PageAssembler::startPage(Render::PageRecorder &recorder, PageState &state,
                              const DrawingContext &context, PageMetadata &meta) const
{
    state.pageIndex = recorder.addPage();
    state.cursorY = m_typography.page.contentRect().top();
    state.blocksOnPage = 0;

    meta.pageNumber = state.pageIndex;
    HeaderFooterRenderer::drawHeader(recorder, m_typography, meta, context.icon, m_measurer);
}

void PageAssembler::stampFooters(Render::PageRecorder &recorder, PageMetadata meta) const
{
    const int total = recorder.pageCount();
    meta.totalPages = total;
    for (int page = 0; page < total; ++page) {
        if (!recorder.setPage(page))
            continue;
        meta.pageNumber = page;
        HeaderFooterRenderer::drawFooter(recorder, m_typography, meta, m_measurer);
    }
}

void PageAssembler::drawBlock(Render::DrawingSurface &surface,
                              const Layout::BlockBox &block, qreal top) const
{
    const qreal left = m_typography.page.margins.left();

    switch (block.type) {
    case Layout::BlockBox::SeparatorBlock:
        if (block.rule) {
            const qreal y = top + block.height / 2.0;
            surface.drawLine(QPointF(left, y), QPointF(left + block.width, y),
                             block.ruleColor, m_typography.dividerWidth);
        }
        return;
    case Layout::BlockBox::TableRowBlock:
        drawTableRow(surface, block, left, top);
        return;
    default:
        break;
    }

    if (block.type == Layout::BlockBox::ListItemBlock && block.isFragmentStart) {
        const qreal baseline = baselineFor(top, block.lineHeight, block.font.size);
        if (block.checkbox) {
            const qreal box = block.font.size * 0.75;
            surface.drawRect(QRectF(left, baseline - box, box, box), QColor(),
                             block.color, 0.75);
        } else {
            Render::FontSpec markerFont = block.font;
            markerFont.italic = false;
            surface.drawText(QPointF(left, baseline), block.marker, markerFont, block.color);
        }
    }

    qreal y = top;
    for (const Layout::LineBox &line : block.lines) {
        surface.drawText(QPointF(left + line.x, baselineFor(y, line.height, block.font.size)),
                         line.text, block.font, block.color);
        y += line.height;
    }
}

void PageAssembler::drawTableRow(Render::DrawingSurface &surface,
                                 const Layout::BlockBox &block,
                                 qreal left, qreal top) const
{
    for (const Layout::TableCellBox &cell : block.cells) {
        const QRectF cellRect(left + cell.x, top, cell.width, block.height);
        surface.drawRect(cellRect, block.background, block.borderColor, block.borderWidth);

        qreal y = top + block.cellPadding;
        for (const Layout::LineBox &line : cell.lines) {
            surface.drawText(QPointF(cellRect.left() + line.x,
                                     baselineFor(y, line.height, cell.font.size)),
                             line.text, cell.font, cell.color);
            y += line.height;
        }
    }
}
