/*
 * exportnaming.h --- Suggested file names for exported documents
 *
 * {yyyy-MM-dd}_{brandCode}_{ToolkitName}_{Suffix}.pdf, with the toolkit
 * name reduced to letters, digits and single underscores.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_EXPORTNAMING_H
#define REPORTPRESS_EXPORTNAMING_H

#include <QDate>
#include <QString>

#include "reportmodel.h"

namespace ExportNaming {

enum class Suffix {
    Report,
    LatestResult,
    AllResults,
};

QString suffixString(Suffix suffix);
Suffix suffixFor(Report::ResultMode mode);

// Empty names fall back to "Toolkit".
QString safeName(const QString &toolkitName);

QString fileName(const Report::BrandingConfig &branding, Suffix suffix,
                 const QDate &date = QDate::currentDate());

} // namespace ExportNaming

#endif // REPORTPRESS_EXPORTNAMING_H
