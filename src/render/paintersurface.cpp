/*
 * paintersurface.cpp --- QPainter backend for DrawingSurface
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paintersurface.h"

#include <QPainter>
#include <QPen>

namespace Render {

PainterSurface::PainterSurface(QPainter *painter)
    : m_painter(painter)
{
}

void PainterSurface::drawText(const QPointF &baseline, const QString &text,
                              const FontSpec &font, const QColor &color)
{
    if (!m_painter || text.isEmpty())
        return;

    m_painter->save();
    m_painter->setFont(font.toQFont());
    m_painter->setPen(color);
    m_painter->drawText(baseline, text);
    m_painter->restore();
}

void PainterSurface::drawLine(const QPointF &from, const QPointF &to,
                              const QColor &color, qreal width)
{
    if (!m_painter)
        return;

    m_painter->save();
    m_painter->setPen(QPen(color, width));
    m_painter->drawLine(from, to);
    m_painter->restore();
}

void PainterSurface::drawRect(const QRectF &rect, const QColor &fill,
                              const QColor &stroke, qreal strokeWidth)
{
    if (!m_painter)
        return;

    m_painter->save();
    if (fill.isValid()) {
        m_painter->setPen(Qt::NoPen);
        m_painter->setBrush(fill);
        m_painter->drawRect(rect);
    }
    if (stroke.isValid()) {
        m_painter->setPen(QPen(stroke, strokeWidth));
        m_painter->setBrush(Qt::NoBrush);
        m_painter->drawRect(rect);
    }
    m_painter->restore();
}

void PainterSurface::drawCircle(const QPointF &center, qreal radius,
                                const QColor &stroke, qreal strokeWidth)
{
    if (!m_painter)
        return;

    m_painter->save();
    m_painter->setRenderHint(QPainter::Antialiasing);
    m_painter->setPen(QPen(stroke, strokeWidth));
    m_painter->setBrush(Qt::NoBrush);
    m_painter->drawEllipse(center, radius, radius);
    m_painter->restore();
}

void PainterSurface::drawImage(const QRectF &rect, const QImage &image)
{
    if (!m_painter || image.isNull())
        return;

    m_painter->save();
    m_painter->setRenderHint(QPainter::SmoothPixmapTransform);
    m_painter->drawImage(rect, image);
    m_painter->restore();
}

} // namespace Render
