/*
 * drawingsurface.cpp --- FontSpec helpers and display-list replay
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "drawingsurface.h"

#include <type_traits>

namespace Render {

QFont FontSpec::toQFont() const
{
    QFont font(family);
    font.setStyleHint(QFont::SansSerif);
    font.setPointSizeF(size);
    font.setBold(bold);
    font.setItalic(italic);
    font.setHintingPreference(QFont::PreferNoHinting);
    return font;
}

DrawingSurface::~DrawingSurface() = default;

void replay(const RecordedPage &page, DrawingSurface &surface)
{
    for (const DrawCommand &command : page.commands) {
        std::visit([&surface](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, TextCommand>) {
                surface.drawText(c.baseline, c.text, c.font, c.color);
            } else if constexpr (std::is_same_v<T, LineCommand>) {
                surface.drawLine(c.from, c.to, c.color, c.width);
            } else if constexpr (std::is_same_v<T, RectCommand>) {
                surface.drawRect(c.rect, c.fill, c.stroke, c.strokeWidth);
            } else if constexpr (std::is_same_v<T, CircleCommand>) {
                surface.drawCircle(c.center, c.radius, c.stroke, c.strokeWidth);
            } else if constexpr (std::is_same_v<T, ImageCommand>) {
                surface.drawImage(c.rect, c.image);
            }
        }, command);
    }
}

} // namespace Render
