/*
 * paintersurface.h --- QPainter backend for DrawingSurface
 *
 * Used to replay recorded pages onto a QPdfWriter. Coordinates are passed
 * through unchanged, so the painter's device must use 72 dpi (1 unit = 1pt).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PAINTERSURFACE_H
#define REPORTPRESS_PAINTERSURFACE_H

#include "drawingsurface.h"

class QPainter;

namespace Render {

class PainterSurface : public DrawingSurface
{
public:
    explicit PainterSurface(QPainter *painter = nullptr);

    /// Set the QPainter to draw with. The caller retains ownership.
    void setPainter(QPainter *painter) { m_painter = painter; }

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
    QPainter *m_painter;
};

} // namespace Render

#endif // REPORTPRESS_PAINTERSURFACE_H
