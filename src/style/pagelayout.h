/*
 * pagelayout.h --- Page geometry: size, margins, header and footer bands
 *
 * All measurements are points (1/72 inch). The header furniture is drawn
 * above and just below the top margin; the content area starts headerGap
 * below the header divider and stops above the reserved footer band.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PAGELAYOUT_H
#define REPORTPRESS_PAGELAYOUT_H

#include <QJsonObject>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QRectF>
#include <QSizeF>
#include <QString>

struct PageLayout
{
    QPageSize::PageSizeId pageSizeId = QPageSize::A4;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QSizeF customSize;                           // overrides pageSizeId when valid
    QMarginsF margins{56.0, 72.0, 56.0, 56.0};   // points

    qreal dividerOffset = 8.0;   // header divider, below margins.top()
    qreal headerGap = 8.0;       // divider to top of content
    qreal footerHeight = 36.0;   // band reserved under the content area
    qreal footerClearance = 24.0; // cleared above the footer baseline

    // Footer fields; {brand}, {page}, {pages}, {title} and {date} are
    // substituted. Empty = the translated default.
    QString footerLeft;
    QString footerRight;

    QSizeF pageSizePoints() const;
    qreal contentWidth() const;

    // Area available to body blocks on every page.
    QRectF contentRect() const;

    qreal dividerY() const { return margins.top() + dividerOffset; }
    qreal footerBaseline() const { return pageSizePoints().height() - footerHeight; }

    // Band wiped before the footer is stamped.
    QRectF footerClearRect() const;

    static PageLayout fromJson(const QJsonObject &obj, const PageLayout &base = {});
    QJsonObject toJson() const;
};

#endif // REPORTPRESS_PAGELAYOUT_H
