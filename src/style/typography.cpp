/*
 * typography.cpp --- Typography presets and JSON serialization
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "typography.h"

#include <QDebug>
#include <QJsonArray>

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------

static TextRole makeRole(qreal size, bool bold, const QColor &color,
                         qreal lineHeight, qreal spaceBefore = 0,
                         qreal spaceAfter = 0)
{
    TextRole role;
    role.font.family = QStringLiteral("Helvetica");
    role.font.size = size;
    role.font.bold = bold;
    role.color = color;
    role.lineHeight = lineHeight;
    role.spaceBefore = spaceBefore;
    role.spaceAfter = spaceAfter;
    return role;
}

// 1.2.1: footer band reserved under the content, 18pt body leading.
static Typography releasePreset()
{
    Typography t;
    t.version = QStringLiteral("1.2.1");

    t.title     = makeRole(16, true,  QColor(17, 24, 39), 20);
    t.meta      = makeRole(8,  false, QColor(90, 96, 110), 10);
    t.heading1  = makeRole(14, true,  QColor(20, 20, 20), 18, 8, 4);
    t.heading2  = makeRole(12, true,  QColor(50, 50, 50), 18, 0, 4);
    t.body      = makeRole(12, false, QColor(50, 50, 50), 18);
    t.tableText = makeRole(10, false, QColor(50, 50, 50), 14);
    t.footer    = makeRole(9,  false, QColor(90, 96, 110), 12);
    return t;
}

// 1.1: no reserved footer band beyond a single line, 16pt body leading.
static Typography legacyPreset()
{
    Typography t = releasePreset();
    t.version = QStringLiteral("1.1");
    t.page.footerHeight = 24.0;
    t.page.footerClearance = 16.0;
    t.body.lineHeight = 16.0;
    t.heading1.lineHeight = 16.0;
    t.heading2.lineHeight = 16.0;
    t.spacerHeight = 4.0;
    return t;
}

QString Typography::currentVersion()
{
    return QStringLiteral("1.2.1");
}

QStringList Typography::presetVersions()
{
    return {QStringLiteral("1.1"), QStringLiteral("1.2.1")};
}

Typography Typography::preset(const QString &version)
{
    if (version == QLatin1String("1.1"))
        return legacyPreset();
    if (!version.isEmpty() && version != currentVersion())
        qWarning() << "Typography: unknown preset" << version << "- using" << currentVersion();
    return releasePreset();
}

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

static QColor colorFromJson(const QJsonValue &v, const QColor &fallback)
{
    if (!v.isString())
        return fallback;
    const QColor c(v.toString());
    return c.isValid() ? c : fallback;
}

static TextRole roleFromJson(const QJsonObject &obj, const TextRole &base)
{
    TextRole role = base;
    role.font.family = obj.value(QLatin1String("family")).toString(base.font.family);
    role.font.size   = obj.value(QLatin1String("size")).toDouble(base.font.size);
    role.font.bold   = obj.value(QLatin1String("bold")).toBool(base.font.bold);
    role.font.italic = obj.value(QLatin1String("italic")).toBool(base.font.italic);
    role.color       = colorFromJson(obj.value(QLatin1String("color")), base.color);
    role.lineHeight  = obj.value(QLatin1String("lineHeight")).toDouble(base.lineHeight);
    role.spaceBefore = obj.value(QLatin1String("spaceBefore")).toDouble(base.spaceBefore);
    role.spaceAfter  = obj.value(QLatin1String("spaceAfter")).toDouble(base.spaceAfter);
    return role;
}

static QJsonObject roleToJson(const TextRole &role)
{
    QJsonObject obj;
    obj[QLatin1String("family")]      = role.font.family;
    obj[QLatin1String("size")]        = role.font.size;
    obj[QLatin1String("bold")]        = role.font.bold;
    obj[QLatin1String("italic")]      = role.font.italic;
    obj[QLatin1String("color")]       = role.color.name();
    obj[QLatin1String("lineHeight")]  = role.lineHeight;
    obj[QLatin1String("spaceBefore")] = role.spaceBefore;
    obj[QLatin1String("spaceAfter")]  = role.spaceAfter;
    return obj;
}

// ---------------------------------------------------------------------------
// fromJson / toJson
// ---------------------------------------------------------------------------

Typography Typography::fromJson(const QJsonObject &obj)
{
    const Typography base = preset(obj.value(QLatin1String("version")).toString());
    Typography t = base;

    t.page = PageLayout::fromJson(obj.value(QLatin1String("page")).toObject(), base.page);

    const QJsonObject header = obj.value(QLatin1String("header")).toObject();
    t.iconSize     = header.value(QLatin1String("iconSize")).toDouble(base.iconSize);
    t.ringGap      = header.value(QLatin1String("ringGap")).toDouble(base.ringGap);
    t.ringWidth    = header.value(QLatin1String("ringWidth")).toDouble(base.ringWidth);
    t.ringColor    = colorFromJson(header.value(QLatin1String("ringColor")), base.ringColor);
    t.titleGap     = header.value(QLatin1String("titleGap")).toDouble(base.titleGap);
    t.dividerColor = colorFromJson(header.value(QLatin1String("dividerColor")), base.dividerColor);
    t.dividerWidth = header.value(QLatin1String("dividerWidth")).toDouble(base.dividerWidth);

    const QJsonObject roles = obj.value(QLatin1String("roles")).toObject();
    t.title     = roleFromJson(roles.value(QLatin1String("title")).toObject(), base.title);
    t.meta      = roleFromJson(roles.value(QLatin1String("meta")).toObject(), base.meta);
    t.heading1  = roleFromJson(roles.value(QLatin1String("heading1")).toObject(), base.heading1);
    t.heading2  = roleFromJson(roles.value(QLatin1String("heading2")).toObject(), base.heading2);
    t.body      = roleFromJson(roles.value(QLatin1String("body")).toObject(), base.body);
    t.tableText = roleFromJson(roles.value(QLatin1String("tableText")).toObject(), base.tableText);
    t.footer    = roleFromJson(roles.value(QLatin1String("footer")).toObject(), base.footer);

    const QJsonObject blocks = obj.value(QLatin1String("blocks")).toObject();
    t.pendingColor          = colorFromJson(blocks.value(QLatin1String("pendingColor")), base.pendingColor);
    t.listIndent            = blocks.value(QLatin1String("listIndent")).toDouble(base.listIndent);
    t.cellPadding           = blocks.value(QLatin1String("cellPadding")).toDouble(base.cellPadding);
    t.tableBorderColor      = colorFromJson(blocks.value(QLatin1String("tableBorderColor")), base.tableBorderColor);
    t.tableBorderWidth      = blocks.value(QLatin1String("tableBorderWidth")).toDouble(base.tableBorderWidth);
    t.tableHeaderBackground = colorFromJson(blocks.value(QLatin1String("tableHeaderBackground")),
                                            base.tableHeaderBackground);
    t.spacerHeight          = blocks.value(QLatin1String("spacerHeight")).toDouble(base.spacerHeight);
    t.ruleHeight            = blocks.value(QLatin1String("ruleHeight")).toDouble(base.ruleHeight);
    t.ruleColor             = colorFromJson(blocks.value(QLatin1String("ruleColor")), base.ruleColor);

    if (obj.contains(QLatin1String("fontFiles"))) {
        t.fontFiles.clear();
        for (const QJsonValue &v : obj.value(QLatin1String("fontFiles")).toArray())
            t.fontFiles.append(v.toString());
    }

    return t;
}

QJsonObject Typography::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("version")] = version;
    obj[QLatin1String("page")] = page.toJson();

    QJsonObject header;
    header[QLatin1String("iconSize")]     = iconSize;
    header[QLatin1String("ringGap")]      = ringGap;
    header[QLatin1String("ringWidth")]    = ringWidth;
    header[QLatin1String("ringColor")]    = ringColor.name();
    header[QLatin1String("titleGap")]     = titleGap;
    header[QLatin1String("dividerColor")] = dividerColor.name();
    header[QLatin1String("dividerWidth")] = dividerWidth;
    obj[QLatin1String("header")] = header;

    QJsonObject roles;
    roles[QLatin1String("title")]     = roleToJson(title);
    roles[QLatin1String("meta")]      = roleToJson(meta);
    roles[QLatin1String("heading1")]  = roleToJson(heading1);
    roles[QLatin1String("heading2")]  = roleToJson(heading2);
    roles[QLatin1String("body")]      = roleToJson(body);
    roles[QLatin1String("tableText")] = roleToJson(tableText);
    roles[QLatin1String("footer")]    = roleToJson(footer);
    obj[QLatin1String("roles")] = roles;

    QJsonObject blocks;
    blocks[QLatin1String("pendingColor")]          = pendingColor.name();
    blocks[QLatin1String("listIndent")]            = listIndent;
    blocks[QLatin1String("cellPadding")]           = cellPadding;
    blocks[QLatin1String("tableBorderColor")]      = tableBorderColor.name();
    blocks[QLatin1String("tableBorderWidth")]      = tableBorderWidth;
    blocks[QLatin1String("tableHeaderBackground")] = tableHeaderBackground.name();
    blocks[QLatin1String("spacerHeight")]          = spacerHeight;
    blocks[QLatin1String("ruleHeight")]            = ruleHeight;
    blocks[QLatin1String("ruleColor")]             = ruleColor.name();
    obj[QLatin1String("blocks")] = blocks;

    if (!fontFiles.isEmpty())
        obj[QLatin1String("fontFiles")] = QJsonArray::fromStringList(fontFiles);

    return obj;
}
