/*
 * linebreaker.h --- Greedy word wrapping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
#ifndef REPORTPRESS_LINEBREAKER_H
#define REPORTPRESS_LINEBREAKER_H

#include <QString>
#include <QStringList>

#include <functional>

namespace LineBreaking {

using MeasureFunction = std::function<qreal(const QString &)>;

// Wrap whitespace-separated words into lines no wider than maxWidth.
// A word that is wider than maxWidth on its own gets a line to itself and
// is never split. '\n' forces a break; an empty text yields no lines.
QStringList wrapText(const QString &text, qreal maxWidth,
                     const MeasureFunction &measure);

} // namespace LineBreaking

#endif // REPORTPRESS_LINEBREAKER_H
