/*
 * headerfooterrenderer.cpp --- Page header and footer furniture
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "headerfooterrenderer.h"
#include "drawingsurface.h"
#include "textmeasurer.h"
#include "typography.h"

#include <KLocalizedString>

namespace HeaderFooterRenderer {

// Shorten @p text with a trailing ellipsis until it fits @p maxWidth.
static QString elided(const QString &text, const Render::FontSpec &font,
                      qreal maxWidth, const Layout::TextMeasurer &measurer)
{
    if (measurer.width(text, font) <= maxWidth)
        return text;

    const QString ellipsis(QChar(0x2026));
    QString shortened = text;
    while (!shortened.isEmpty()) {
        shortened.chop(1);
        const QString candidate = shortened.trimmed() + ellipsis;
        if (measurer.width(candidate, font) <= maxWidth)
            return candidate;
    }
    return {};
}

static QString generatedLine(const PageMetadata &meta)
{
    const QString when = meta.generatedAt.toString(QStringLiteral("yyyy-MM-dd HH:mm"));
    if (meta.checksum.isEmpty())
        return i18nc("@info header meta line", "Generated %1", when);
    return i18nc("@info header meta line", "Generated %1 · checksum %2",
                 when, meta.checksum);
}

void drawHeader(Render::DrawingSurface &surface, const Typography &typography,
                const PageMetadata &meta, const QImage &icon,
                const Layout::TextMeasurer &measurer)
{
    const PageLayout &page = typography.page;
    const qreal left = page.margins.left();
    const qreal right = left + page.contentWidth();
    const qreal top = page.margins.top();
    const qreal baseline = top - page.dividerOffset / 2.0;

    // The icon square is reserved even when no icon loaded.
    const qreal size = typography.iconSize;
    const qreal titleX = left + size + typography.titleGap;
    if (!icon.isNull()) {
        const QRectF iconRect(left, top - size - page.dividerOffset, size, size);
        surface.drawCircle(iconRect.center(), size / 2.0 + typography.ringGap,
                           typography.ringColor, typography.ringWidth);
        surface.drawImage(iconRect, icon);
    }

    const QString metaText = generatedLine(meta);
    const qreal metaWidth = measurer.width(metaText, typography.meta.font);
    surface.drawText(QPointF(right - metaWidth, baseline), metaText,
                     typography.meta.font, typography.meta.color);

    const qreal titleRoom = right - metaWidth - typography.titleGap - titleX;
    const QString title = elided(meta.title, typography.title.font, titleRoom, measurer);
    if (!title.isEmpty()) {
        surface.drawText(QPointF(titleX, baseline), title,
                         typography.title.font, typography.title.color);
    }

    surface.drawLine(QPointF(left, page.dividerY()), QPointF(right, page.dividerY()),
                     typography.dividerColor, typography.dividerWidth);
}

void drawFooter(Render::DrawingSurface &surface, const Typography &typography,
                const PageMetadata &meta, const Layout::TextMeasurer &measurer)
{
    const PageLayout &page = typography.page;
    const TextRole &role = typography.footer;
    const qreal baseline = page.footerBaseline();

    // Anything that strayed into the band goes under the footer.
    surface.drawRect(page.footerClearRect(), Qt::white);

    const QString leftText = footerLeftText(typography, meta);
    if (!leftText.isEmpty())
        surface.drawText(QPointF(page.margins.left(), baseline), leftText, role.font, role.color);

    const QString rightText = footerRightText(typography, meta);
    if (!rightText.isEmpty()) {
        const qreal right = page.margins.left() + page.contentWidth();
        surface.drawText(QPointF(right - measurer.width(rightText, role.font), baseline),
                         rightText, role.font, role.color);
    }
}

QString footerLeftText(const Typography &typography, const PageMetadata &meta)
{
    const QString pattern = typography.page.footerLeft.isEmpty()
        ? i18nc("@info footer, {brand} is the brand line", "Powered by {brand}")
        : typography.page.footerLeft;
    return resolveField(pattern, meta);
}

QString footerRightText(const Typography &typography, const PageMetadata &meta)
{
    const QString pattern = typography.page.footerRight.isEmpty()
        ? i18nc("@info footer page counter", "Page {page} of {pages}")
        : typography.page.footerRight;
    return resolveField(pattern, meta);
}

QString resolveField(const QString &text, const PageMetadata &meta)
{
    if (text.isEmpty())
        return {};

    QString result = text;
    result.replace(QLatin1String("{pages}"), QString::number(meta.totalPages));
    result.replace(QLatin1String("{page}"), QString::number(meta.pageNumber + 1));
    result.replace(QLatin1String("{brand}"), meta.brandLine);
    result.replace(QLatin1String("{title}"), meta.title);
    result.replace(QLatin1String("{date}"),
                   meta.generatedAt.date().toString(Qt::ISODate));
    result.replace(QLatin1String("{checksum}"), meta.checksum);
    return result;
}

} // namespace HeaderFooterRenderer
