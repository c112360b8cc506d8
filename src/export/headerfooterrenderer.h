/*
 * headerfooterrenderer.h --- Page header and footer furniture
 *
 * The header (icon, ring, title, generation line, divider) is drawn when
 * a page is opened. The footer needs the final page count and is stamped
 * on every page once layout is complete.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_HEADERFOOTERRENDERER_H
#define REPORTPRESS_HEADERFOOTERRENDERER_H

#include <QDateTime>
#include <QImage>
#include <QString>

struct Typography;

namespace Layout {
class TextMeasurer;
}

namespace Render {
class DrawingSurface;
}

struct PageMetadata {
    int pageNumber = 0;   // 0-based
    int totalPages = 1;
    QString brandLine;
    QString title;
    QDateTime generatedAt;
    QString checksum;     // empty = omitted from the header
};

namespace HeaderFooterRenderer {

void drawHeader(Render::DrawingSurface &surface, const Typography &typography,
                const PageMetadata &meta, const QImage &icon,
                const Layout::TextMeasurer &measurer);

void drawFooter(Render::DrawingSurface &surface, const Typography &typography,
                const PageMetadata &meta, const Layout::TextMeasurer &measurer);

QString footerLeftText(const Typography &typography, const PageMetadata &meta);
QString footerRightText(const Typography &typography, const PageMetadata &meta);

// Substitutes {page}, {pages}, {brand}, {title}, {date} and {checksum}.
QString resolveField(const QString &text, const PageMetadata &meta);

} // namespace HeaderFooterRenderer

#endif // REPORTPRESS_HEADERFOOTERRENDERER_H
