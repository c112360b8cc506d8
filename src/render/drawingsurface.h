/*
 * drawingsurface.h --- Abstract vector drawing surface
 *
 * The page assembler only ever talks to this interface. PageRecorder
 * captures the calls; PainterSurface forwards them to a QPainter (PDF
 * writer, image, printer).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_DRAWINGSURFACE_H
#define REPORTPRESS_DRAWINGSURFACE_H

#include "drawcommand.h"

namespace Render {

class DrawingSurface
{
public:
    virtual ~DrawingSurface();

    /// Draw a single line of text with its baseline starting at @p baseline.
    virtual void drawText(const QPointF &baseline, const QString &text,
                          const FontSpec &font, const QColor &color) = 0;

    virtual void drawLine(const QPointF &from, const QPointF &to,
                          const QColor &color, qreal width = 0.5) = 0;

    /// Fill and/or stroke a rectangle. Invalid colours are skipped.
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke = QColor(),
                          qreal strokeWidth = 0) = 0;

    /// Stroke a circle outline.
    virtual void drawCircle(const QPointF &center, qreal radius,
                            const QColor &stroke, qreal strokeWidth) = 0;

    virtual void drawImage(const QRectF &rect, const QImage &image) = 0;
};

/// Send every command of @p page to @p surface, in recording order.
void replay(const RecordedPage &page, DrawingSurface &surface);

} // namespace Render

#endif // REPORTPRESS_DRAWINGSURFACE_H
