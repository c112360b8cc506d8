/*
 * pageassembler.h --- Two-pass page assembly
 *
 * Pass 1 streams the laid-out blocks onto pages, opening a page (with its
 * header) whenever the break policy asks for one. Pass 2 revisits every
 * recorded page and stamps the footer, which needs the final page count.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PAGEASSEMBLER_H
#define REPORTPRESS_PAGEASSEMBLER_H

#include <QDateTime>
#include <QList>
#include <QString>

#include "contentmodel.h"
#include "drawcommand.h"
#include "headerfooterrenderer.h"
#include "layoutengine.h"
#include "resourceloader.h"

struct Typography;

namespace Render {
class DrawingSurface;
class PageRecorder;
}

class PageAssembler
{
public:
    struct PageState {
        int pageIndex = -1;
        qreal cursorY = 0;      // top of the next block, page coordinates
        int blocksOnPage = 0;

        bool isEmpty() const { return blocksOnPage == 0; }
    };

    struct HeaderInfo {
        QString title;          // header title, elided to fit
        QDateTime generatedAt;
        QString checksum;       // empty = not shown
        QString brandLine;      // footer {brand}
    };

    PageAssembler(const Typography &typography, const Layout::TextMeasurer &measurer);

    // Lays out @p blocks and assembles them. An invalid context yields an
    // empty document.
    Render::PageDocument assemble(const QList<Content::LayoutBlock> &blocks,
                                  const DrawingContext &context,
                                  const HeaderInfo &header) const;

    Render::PageDocument assembleBoxes(const QList<Layout::BlockBox> &boxes,
                                       const DrawingContext &context,
                                       const HeaderInfo &header) const;

    // Baseline of a line whose box starts at @p top.
    static qreal baselineFor(qreal top, qreal lineHeight, qreal fontSize);

private:
    void startPage(Render::PageRecorder &recorder, PageState &state,
                   const DrawingContext &context, PageMetadata &meta) const;
    void stampFooters(Render::PageRecorder &recorder, PageMetadata meta) const;

    void drawBlock(Render::DrawingSurface &surface, const Layout::BlockBox &block,
                   qreal top) const;
    void drawTableRow(Render::DrawingSurface &surface, const Layout::BlockBox &block,
                      qreal left, qreal top) const;

    const Typography &m_typography;
    const Layout::TextMeasurer &m_measurer;
};

#endif // REPORTPRESS_PAGEASSEMBLER_H
