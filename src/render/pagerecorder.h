/*
 * pagerecorder.h --- DrawingSurface that records pages as display lists
 *
 * Unlike a streaming PDF writer, any recorded page can be made current
 * again with setPage(), which is what lets footers be stamped after the
 * final page count is known.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PAGERECORDER_H
#define REPORTPRESS_PAGERECORDER_H

#include "drawingsurface.h"

#include <QStringList>

namespace Render {

class PageRecorder : public DrawingSurface
{
public:
    explicit PageRecorder(const QSizeF &pageSize);

    /// Append a blank page, make it current and return its index.
    int addPage();

    /// Make an existing page current. Returns false for an unknown index.
    bool setPage(int index);

    int pageCount() const { return m_document.pages.size(); }

    const PageDocument &document() const { return m_document; }
    PageDocument takeDocument();

    /// Text of every text command on @p page, in drawing order.
    static QStringList textOf(const RecordedPage &page);

    // --- DrawingSurface ---

    void drawText(const QPointF &baseline, const QString &text,
                  const FontSpec &font, const QColor &color) override;
    void drawLine(const QPointF &from, const QPointF &to,
                  const QColor &color, qreal width = 0.5) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(),
                  qreal strokeWidth = 0) override;
    void drawCircle(const QPointF &center, qreal radius,
                    const QColor &stroke, qreal strokeWidth) override;
    void drawImage(const QRectF &rect, const QImage &image) override;

private:
    void record(DrawCommand command);

    PageDocument m_document;
    int m_current = -1;
};

} // namespace Render

#endif // REPORTPRESS_PAGERECORDER_H
