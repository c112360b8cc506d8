/*
 * exportnaming.cpp --- Suggested file names for exported documents
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "exportnaming.h"

#include <QRegularExpression>

namespace ExportNaming {

QString suffixString(Suffix suffix)
{
    switch (suffix) {
    case Suffix::LatestResult: return QStringLiteral("Latest_Result");
    case Suffix::AllResults:   return QStringLiteral("All_Results");
    case Suffix::Report:       break;
    }
    return QStringLiteral("Report");
}

Suffix suffixFor(Report::ResultMode mode)
{
    return mode == Report::ResultMode::Latest ? Suffix::LatestResult : Suffix::AllResults;
}

QString safeName(const QString &toolkitName)
{
    static const QRegularExpression unsafeRx(
        QStringLiteral("[^a-z0-9]+"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression edgeRx(QStringLiteral("^_+|_+$"));

    QString name = toolkitName;
    name.replace(unsafeRx, QStringLiteral("_"));
    name.remove(edgeRx);
    return name.isEmpty() ? QStringLiteral("Toolkit") : name;
}

QString fileName(const Report::BrandingConfig &branding, Suffix suffix, const QDate &date)
{
    return QStringLiteral("%1_%2_%3_%4.pdf")
        .arg(date.toString(QStringLiteral("yyyy-MM-dd")),
             branding.brandCode,
             safeName(branding.toolkitName),
             suffixString(suffix));
}

} // namespace ExportNaming
