/*
 * textmeasurer.h --- Pluggable text width measurement
 *
 * Layout never asks a drawing surface for metrics; it goes through this
 * interface so tests can substitute a fixed-width measurer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_TEXTMEASURER_H
#define REPORTPRESS_TEXTMEASURER_H

#include "drawcommand.h"

#include <QImage>

namespace Layout {

class TextMeasurer
{
public:
    virtual ~TextMeasurer();

    /// Advance width of @p text in points.
    virtual qreal width(const QString &text, const Render::FontSpec &font) const = 0;
};

/// Measures with QFontMetricsF at 72 dpi, matching a QPdfWriter set to
/// a resolution of 72 (one device unit per point).
class FontMetricsMeasurer : public TextMeasurer
{
public:
    FontMetricsMeasurer();

    qreal width(const QString &text, const Render::FontSpec &font) const override;

private:
    QImage m_device;   // metrics device at 72 dpi
};

} // namespace Layout

#endif // REPORTPRESS_TEXTMEASURER_H
