/*
 * drawcommand.h --- Recorded page-drawing instructions
 *
 * Pages are captured as display lists so the footer pass can revisit any
 * page after layout has finished. Coordinates are points, origin at the
 * top-left of the page, y growing downwards.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_DRAWCOMMAND_H
#define REPORTPRESS_DRAWCOMMAND_H

#include <QColor>
#include <QFont>
#include <QImage>
#include <QList>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include <variant>

namespace Render {

struct FontSpec {
    QString family = QStringLiteral("Helvetica");
    qreal size = 12.0;   // points
    bool bold = false;
    bool italic = false;

    QFont toQFont() const;
};

struct TextCommand {
    QPointF baseline;
    QString text;
    FontSpec font;
    QColor color;
};

struct LineCommand {
    QPointF from;
    QPointF to;
    QColor color;
    qreal width = 0.5;
};

struct RectCommand {
    QRectF rect;
    QColor fill;          // invalid = no fill
    QColor stroke;        // invalid = no stroke
    qreal strokeWidth = 0;
};

struct CircleCommand {
    QPointF center;
    qreal radius = 0;
    QColor stroke;
    qreal strokeWidth = 1.0;
};

struct ImageCommand {
    QRectF rect;
    QImage image;
};

using DrawCommand = std::variant<
    TextCommand,
    LineCommand,
    RectCommand,
    CircleCommand,
    ImageCommand
>;

struct RecordedPage {
    QList<DrawCommand> commands;
};

struct PageDocument {
    QSizeF pageSize;   // points
    QList<RecordedPage> pages;

    int pageCount() const { return pages.size(); }
};

} // namespace Render

#endif // REPORTPRESS_DRAWCOMMAND_H
