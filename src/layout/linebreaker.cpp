/*
 * linebreaker.cpp --- Greedy word wrapping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linebreaker.h"

#include <QRegularExpression>

namespace LineBreaking {

static void wrapSegment(const QString &segment, qreal maxWidth,
                        const MeasureFunction &measure, QStringList &lines)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList words = segment.split(whitespace, Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        lines.append(QString());
        return;
    }

    QString current = words.first();
    for (int i = 1; i < words.size(); ++i) {
        const QString candidate = current + QLatin1Char(' ') + words[i];
        if (measure(candidate) > maxWidth) {
            lines.append(current);
            current = words[i];
        } else {
            current = candidate;
        }
    }
    lines.append(current);
}

QStringList wrapText(const QString &text, qreal maxWidth,
                     const MeasureFunction &measure)
{
    QStringList lines;
    if (text.trimmed().isEmpty())
        return lines;

    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));

    const QStringList segments = normalized.trimmed().split(QLatin1Char('\n'));
    for (const QString &segment : segments)
        wrapSegment(segment, maxWidth, measure, lines);
    return lines;
}

} // namespace LineBreaking
