/*
 * brandingsettings.cpp --- Branding and typography from reportpressrc
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "brandingsettings.h"

#include <KConfigGroup>

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace BrandingSettings {

static KSharedConfigPtr configOrDefault(KSharedConfigPtr config)
{
    if (config)
        return config;
    return KSharedConfig::openConfig(QStringLiteral("reportpressrc"));
}

Report::BrandingConfig loadBranding(KSharedConfigPtr config)
{
    const Report::BrandingConfig defaults;
    KConfigGroup group(configOrDefault(config), QStringLiteral("Branding"));

    Report::BrandingConfig branding;
    branding.toolkitName = group.readEntry("ToolkitName", defaults.toolkitName);
    branding.iconUrl = group.readEntry("IconUrl", defaults.iconUrl);
    branding.brandLine = group.readEntry("BrandLine", defaults.brandLine);
    branding.brandCode = group.readEntry("BrandCode", defaults.brandCode);
    return branding;
}

void saveBranding(const Report::BrandingConfig &branding, KSharedConfigPtr config)
{
    KConfigGroup group(configOrDefault(config), QStringLiteral("Branding"));
    group.writeEntry("ToolkitName", branding.toolkitName);
    group.writeEntry("IconUrl", branding.iconUrl);
    group.writeEntry("BrandLine", branding.brandLine);
    group.writeEntry("BrandCode", branding.brandCode);
    group.sync();
}

Typography loadTypography(KSharedConfigPtr config)
{
    KConfigGroup group(configOrDefault(config), QStringLiteral("Typography"));

    Typography typography = Typography::preset(
        group.readEntry("Preset", Typography::currentVersion()));

    const QString file = group.readEntry("File", QString());
    if (!file.isEmpty() && !loadTypographyFile(file, &typography))
        qWarning() << "BrandingSettings: ignoring typography file" << file;

    return typography;
}

bool loadTypographyFile(const QString &path, Typography *typography)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "BrandingSettings: cannot open" << path << file.errorString();
        return false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "BrandingSettings: invalid typography JSON" << path << error.errorString();
        return false;
    }

    *typography = Typography::fromJson(doc.object());
    return true;
}

} // namespace BrandingSettings
