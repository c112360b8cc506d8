/*
 * reportresolver.cpp --- Placeholder and default resolution for report sections
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportresolver.h"

#include <QDate>
#include <QLocale>
#include <QRegularExpression>

namespace Report {

namespace {

Cell cellFor(const std::optional<QString> &value)
{
    if (!value || value->trimmed().isEmpty())
        return Cell{pendingMarkerText(), true};
    return Cell{value->trimmed(), false};
}

Cell dateCellFor(const std::optional<QString> &value)
{
    Cell cell = cellFor(value);
    if (!cell.pending)
        cell.text = displayDate(cell.text);
    return cell;
}

ParagraphsBody pendingBody()
{
    return ParagraphsBody{{Cell{pendingMarkerText(), true}}};
}

Section summarySection(const GeneratedContent &content)
{
    Section section;
    section.id = QStringLiteral("summary");
    section.title = QStringLiteral("Executive Compliance Summary");

    ParagraphsBody body;
    if (content.summary) {
        const QStringList paragraphs = splitParagraphs(*content.summary);
        for (const QString &p : paragraphs)
            body.paragraphs.append(Cell{p, false});
    }
    section.body = body.paragraphs.isEmpty() ? pendingBody() : body;
    return section;
}

Section listSection(const QString &id, const QString &title,
                    ListBody::Kind kind,
                    const std::optional<QStringList> &items,
                    const Cell &defaultItem)
{
    Section section;
    section.id = id;
    section.title = title;

    if (!items) {
        section.body = pendingBody();
        return section;
    }

    ListBody body;
    body.kind = kind;
    for (const QString &item : *items)
        body.items.append(cellFor(item));
    if (body.items.isEmpty())
        body.items.append(defaultItem);
    section.body = body;
    return section;
}

Section timelineSection(const GeneratedContent &content)
{
    Section section;
    section.id = QStringLiteral("timeline");
    section.title = QStringLiteral("Compliance Timeline");

    if (!content.timeline) {
        section.body = pendingBody();
        return section;
    }

    TableBody table;
    table.columns = {QStringLiteral("Milestone"), QStringLiteral("Owner"),
                     QStringLiteral("Due Date"), QStringLiteral("Notes")};
    for (const TimelineEntry &e : *content.timeline)
        table.rows.append({cellFor(e.milestone), cellFor(e.owner),
                           dateCellFor(e.dueDate), cellFor(e.notes)});

    if (table.rows.isEmpty()) {
        table.defaultRow = true;
        table.rows.append({
            Cell{QStringLiteral("[Timeline unavailable]"), false},
            Cell{QStringLiteral("[Pending]"), false},
            Cell{QStringLiteral("[Deadline required]"), false},
            Cell{QStringLiteral("Please provide filing deadline to generate timeline"), false},
        });
    }
    section.body = table;
    return section;
}

Section riskSection(const GeneratedContent &content)
{
    Section section;
    section.id = QStringLiteral("risks");
    section.title = QStringLiteral("Risk Matrix");

    if (!content.riskMatrix) {
        section.body = pendingBody();
        return section;
    }

    TableBody table;
    table.columns = {QStringLiteral("Risk"), QStringLiteral("Severity"),
                     QStringLiteral("Likelihood"), QStringLiteral("Mitigation")};
    for (const RiskEntry &e : *content.riskMatrix)
        table.rows.append({cellFor(e.risk), cellFor(e.severity),
                           cellFor(e.likelihood), cellFor(e.mitigation)});

    if (table.rows.isEmpty()) {
        table.defaultRow = true;
        table.rows.append({
            Cell{QStringLiteral("Late filing"), false},
            Cell{QStringLiteral("High"), false},
            Cell{QStringLiteral("Medium"), false},
            Cell{QStringLiteral("Calendar the deadline, file early and keep proof of submission"), false},
        });
    }
    section.body = table;
    return section;
}

} // namespace

QString pendingMarkerText()
{
    return QStringLiteral("[Pending Input]");
}

QStringList splitParagraphs(const QString &text)
{
    static const QRegularExpression blankLines(QStringLiteral("\\n[ \\t\\r]*\\n\\s*"));

    QStringList result;
    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    const QStringList parts = normalized.split(blankLines, Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty())
            result.append(trimmed);
    }
    return result;
}

QString displayDate(const QString &value)
{
    const QString trimmed = value.trimmed();

    QDate date = QDate::fromString(trimmed, Qt::ISODate);
    if (!date.isValid()) {
        const QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODate);
        if (dt.isValid())
            date = dt.date();
    }
    if (!date.isValid())
        return value;

    return QLocale::c().toString(date, QStringLiteral("MMM d, yyyy"));
}

ResolvedReport resolve(const Payload &payload, const GeneratedContent &content)
{
    ResolvedReport report;
    report.title = QStringLiteral("Compliance Report");
    report.subtitle = cellFor(payload.entityName);
    report.fields = {
        {QStringLiteral("Entity type"), cellFor(payload.entityType)},
        {QStringLiteral("Jurisdiction"), cellFor(payload.jurisdiction)},
        {QStringLiteral("Filing type"), cellFor(payload.filingType)},
        {QStringLiteral("Deadline"), dateCellFor(payload.deadline)},
    };

    const Cell pendingItem{pendingMarkerText(), true};

    report.sections.append(summarySection(content));
    report.sections.append(listSection(QStringLiteral("checklist"),
                                       QStringLiteral("Filing Requirements Checklist"),
                                       ListBody::Checklist, content.checklist,
                                       pendingItem));
    report.sections.append(timelineSection(content));
    report.sections.append(riskSection(content));
    report.sections.append(listSection(QStringLiteral("recommendations"),
                                       QStringLiteral("Strategic Recommendations"),
                                       ListBody::Ordered, content.recommendations,
                                       pendingItem));

    Section references = listSection(
        QStringLiteral("references"), QStringLiteral("Official References"),
        ListBody::Bulleted, content.references,
        Cell{QStringLiteral("Contact your state or federal agency for official filing portals."), false});
    references.note = Cell{QStringLiteral(
        "Disclaimer: This report is for informational purposes only and does "
        "not constitute legal, tax, or financial advice. Consult with licensed "
        "professionals for guidance specific to your situation."), false};
    report.sections.append(references);

    return report;
}

} // namespace Report
