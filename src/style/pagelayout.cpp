/*
 * pagelayout.cpp --- Page geometry and its JSON serialization
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"

QSizeF PageLayout::pageSizePoints() const
{
    QSizeF full = customSize.isValid() && !customSize.isEmpty()
        ? customSize
        : QPageSize(pageSizeId).size(QPageSize::Point);
    if (orientation == QPageLayout::Landscape)
        full.transpose();
    return full;
}

qreal PageLayout::contentWidth() const
{
    return pageSizePoints().width() - margins.left() - margins.right();
}

QRectF PageLayout::contentRect() const
{
    const QSizeF page = pageSizePoints();
    const qreal top = dividerY() + headerGap;
    const qreal bottom = page.height() - margins.bottom() - footerHeight;
    return QRectF(margins.left(), top, contentWidth(), qMax<qreal>(0.0, bottom - top));
}

QRectF PageLayout::footerClearRect() const
{
    const qreal top = footerBaseline() - footerClearance;
    return QRectF(margins.left(), top, contentWidth(),
                  pageSizePoints().height() - top);
}

// ---------------------------------------------------------------------------
// fromJson / toJson
// ---------------------------------------------------------------------------

static QPageSize::PageSizeId pageSizeFromString(const QString &name)
{
    if (name == QLatin1String("Letter")) return QPageSize::Letter;
    if (name == QLatin1String("Legal"))  return QPageSize::Legal;
    if (name == QLatin1String("A5"))     return QPageSize::A5;
    return QPageSize::A4;
}

static QString pageSizeToString(QPageSize::PageSizeId id)
{
    switch (id) {
    case QPageSize::Letter: return QStringLiteral("Letter");
    case QPageSize::Legal:  return QStringLiteral("Legal");
    case QPageSize::A5:     return QStringLiteral("A5");
    default:                return QStringLiteral("A4");
    }
}

PageLayout PageLayout::fromJson(const QJsonObject &obj, const PageLayout &base)
{
    PageLayout pl = base;

    if (obj.contains(QLatin1String("pageSize")))
        pl.pageSizeId = pageSizeFromString(obj.value(QLatin1String("pageSize")).toString());
    if (obj.contains(QLatin1String("orientation"))) {
        pl.orientation = obj.value(QLatin1String("orientation")).toString()
                == QLatin1String("landscape")
            ? QPageLayout::Landscape : QPageLayout::Portrait;
    }
    if (obj.contains(QLatin1String("width")) && obj.contains(QLatin1String("height"))) {
        pl.customSize = QSizeF(obj.value(QLatin1String("width")).toDouble(),
                               obj.value(QLatin1String("height")).toDouble());
    }
    if (obj.contains(QLatin1String("margins"))) {
        const QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        pl.margins = QMarginsF(
            m.value(QLatin1String("left")).toDouble(base.margins.left()),
            m.value(QLatin1String("top")).toDouble(base.margins.top()),
            m.value(QLatin1String("right")).toDouble(base.margins.right()),
            m.value(QLatin1String("bottom")).toDouble(base.margins.bottom()));
    }

    pl.dividerOffset   = obj.value(QLatin1String("dividerOffset")).toDouble(base.dividerOffset);
    pl.headerGap       = obj.value(QLatin1String("headerGap")).toDouble(base.headerGap);
    pl.footerHeight    = obj.value(QLatin1String("footerHeight")).toDouble(base.footerHeight);
    pl.footerClearance = obj.value(QLatin1String("footerClearance")).toDouble(base.footerClearance);

    if (obj.contains(QLatin1String("footer"))) {
        const QJsonObject f = obj.value(QLatin1String("footer")).toObject();
        pl.footerLeft  = f.value(QLatin1String("left")).toString(base.footerLeft);
        pl.footerRight = f.value(QLatin1String("right")).toString(base.footerRight);
    }

    return pl;
}

QJsonObject PageLayout::toJson() const
{
    QJsonObject obj;

    obj[QLatin1String("pageSize")] = pageSizeToString(pageSizeId);
    obj[QLatin1String("orientation")] = (orientation == QPageLayout::Landscape)
        ? QStringLiteral("landscape") : QStringLiteral("portrait");
    if (customSize.isValid() && !customSize.isEmpty()) {
        obj[QLatin1String("width")]  = customSize.width();
        obj[QLatin1String("height")] = customSize.height();
    }

    QJsonObject m;
    m[QLatin1String("left")]   = margins.left();
    m[QLatin1String("top")]    = margins.top();
    m[QLatin1String("right")]  = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    obj[QLatin1String("margins")] = m;

    obj[QLatin1String("dividerOffset")]   = dividerOffset;
    obj[QLatin1String("headerGap")]       = headerGap;
    obj[QLatin1String("footerHeight")]    = footerHeight;
    obj[QLatin1String("footerClearance")] = footerClearance;

    if (!footerLeft.isEmpty() || !footerRight.isEmpty()) {
        QJsonObject f;
        f[QLatin1String("left")]  = footerLeft;
        f[QLatin1String("right")] = footerRight;
        obj[QLatin1String("footer")] = f;
    }

    return obj;
}
