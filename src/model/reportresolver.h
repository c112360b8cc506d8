/*
 * reportresolver.h --- Placeholder and default resolution for report sections
 *
 * Applies the pending-marker and empty-list default rules once, producing a
 * fixed sequence of sections that both the markup renderer and the block
 * builder walk. Keeping the rules in one place is what makes the on-screen
 * markup and the exported pages carry the same text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_REPORTRESOLVER_H
#define REPORTPRESS_REPORTRESOLVER_H

#include "reportmodel.h"

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

namespace Report {

// A resolved text value: either real content or the pending marker.
struct Cell {
    QString text;
    bool pending = false;
};

struct Field {
    QString label;
    Cell value;
};

struct ParagraphsBody {
    QList<Cell> paragraphs;
};

struct ListBody {
    enum Kind { Bulleted, Ordered, Checklist };
    Kind kind = Bulleted;
    QList<Cell> items;
};

struct TableBody {
    QStringList columns;
    QList<QList<Cell>> rows;
    bool defaultRow = false; // rows hold the single default row of an empty list
};

using SectionBody = std::variant<ParagraphsBody, ListBody, TableBody>;

struct Section {
    QString id;     // stable identifier ("summary", "checklist", ...)
    QString title;
    SectionBody body;
    std::optional<Cell> note; // trailing note, e.g. the references disclaimer
};

struct ResolvedReport {
    QString title;
    Cell subtitle;          // entity name
    QList<Field> fields;    // entity type, jurisdiction, filing type, deadline
    QList<Section> sections;
};

QString pendingMarkerText();

// Fixed order: summary, checklist, timeline, risks, recommendations, references.
ResolvedReport resolve(const Payload &payload, const GeneratedContent &content);

// Split on runs of blank lines; each paragraph is trimmed, empties dropped.
QStringList splitParagraphs(const QString &text);

// ISO dates display as "MMM d, yyyy" (C locale). Anything else is returned as is.
QString displayDate(const QString &value);

} // namespace Report

#endif // REPORTPRESS_REPORTRESOLVER_H
