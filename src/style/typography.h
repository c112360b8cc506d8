/*
 * typography.h --- Versioned typography and spacing configuration
 *
 * Each successive look of the exported report is a preset of this struct
 * rather than a separate code path. A JSON file may start from any preset
 * (by "version") and override individual values.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_TYPOGRAPHY_H
#define REPORTPRESS_TYPOGRAPHY_H

#include <QColor>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "drawcommand.h"
#include "pagelayout.h"

struct TextRole {
    Render::FontSpec font;
    QColor color = QColor(50, 50, 50);
    qreal lineHeight = 18.0;
    qreal spaceBefore = 0;
    qreal spaceAfter = 0;
};

struct Typography
{
    QString version;
    PageLayout page;

    // Header furniture
    qreal iconSize = 32.0;
    qreal ringGap = 3.0;          // ring radius = iconSize / 2 + ringGap
    qreal ringWidth = 1.5;
    QColor ringColor = QColor(79, 195, 247);
    qreal titleGap = 10.0;        // icon to title text
    TextRole title;
    TextRole meta;                // generation timestamp and checksum
    QColor dividerColor = QColor(230, 236, 244);
    qreal dividerWidth = 0.5;

    // Body
    TextRole heading1;
    TextRole heading2;
    TextRole body;
    TextRole tableText;
    QColor pendingColor = QColor(180, 83, 9);
    qreal listIndent = 18.0;
    qreal cellPadding = 4.0;
    QColor tableBorderColor = QColor(203, 213, 225);
    qreal tableBorderWidth = 0.5;
    QColor tableHeaderBackground = QColor(241, 245, 249);
    qreal spacerHeight = 6.0;     // blank separator
    qreal ruleHeight = 16.0;      // separator with a divider rule
    QColor ruleColor = QColor(230, 236, 244);

    // Footer
    TextRole footer;

    // Font files registered before export. Empty = system fonts only.
    QStringList fontFiles;

    static QString currentVersion();
    static QStringList presetVersions();

    // Unknown versions fall back to the current preset.
    static Typography preset(const QString &version = currentVersion());

    static Typography fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    const TextRole &headingRole(int level) const { return level <= 1 ? heading1 : heading2; }
};

#endif // REPORTPRESS_TYPOGRAPHY_H
