/*
 * textmeasurer.cpp --- Pluggable text width measurement
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textmeasurer.h"

#include <QFontMetricsF>

namespace Layout {

TextMeasurer::~TextMeasurer() = default;

FontMetricsMeasurer::FontMetricsMeasurer()
    : m_device(1, 1, QImage::Format_ARGB32_Premultiplied)
{
    // 72 dpi expressed in dots per metre
    const int dpm = qRound(72.0 / 0.0254);
    m_device.setDotsPerMeterX(dpm);
    m_device.setDotsPerMeterY(dpm);
}

qreal FontMetricsMeasurer::width(const QString &text, const Render::FontSpec &font) const
{
    if (text.isEmpty())
        return 0;
    const QFontMetricsF metrics(font.toQFont(), &m_device);
    return metrics.horizontalAdvance(text);
}

} // namespace Layout
