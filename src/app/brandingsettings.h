/*
 * brandingsettings.h --- Branding and typography from reportpressrc
 *
 *   [Branding]
 *   ToolkitName=...   IconUrl=...   BrandLine=...   BrandCode=...
 *
 *   [Typography]
 *   Preset=1.2.1      File=/path/to/typography.json
 *
 * A File entry wins over Preset. Missing entries keep the built-in values.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_BRANDINGSETTINGS_H
#define REPORTPRESS_BRANDINGSETTINGS_H

#include <KSharedConfig>

#include <QString>

#include "reportmodel.h"
#include "typography.h"

namespace BrandingSettings {

// Null @p config = the application's reportpressrc.
Report::BrandingConfig loadBranding(KSharedConfigPtr config = {});
void saveBranding(const Report::BrandingConfig &branding, KSharedConfigPtr config = {});

Typography loadTypography(KSharedConfigPtr config = {});

// Reads a typography JSON file. Returns false (and leaves @p typography
// untouched) when the file is missing or not a JSON object.
bool loadTypographyFile(const QString &path, Typography *typography);

} // namespace BrandingSettings

#endif // REPORTPRESS_BRANDINGSETTINGS_H
