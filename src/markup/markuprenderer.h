/*
 * markuprenderer.h --- Canonical HTML rendering of a compliance report
 *
 * Output is a pure function of (payload, content): no clock, no locale, no
 * I/O. Every value is HTML-escaped before insertion and every absent or
 * blank value becomes a <span class="pending"> marker, so the structural
 * shape of the document never depends on the data.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_MARKUPRENDERER_H
#define REPORTPRESS_MARKUPRENDERER_H

#include "reportmodel.h"
#include "reportresolver.h"

#include <QDateTime>
#include <QString>

class MarkupRenderer
{
public:
    static QString render(const Report::Payload &payload,
                          const Report::GeneratedContent &content);

    // Renders and fingerprints in one step.
    static Report::RenderedReport renderReport(const Report::Payload &payload,
                                               const Report::GeneratedContent &content,
                                               const QDateTime &createdAt);

    static QString escape(const QString &text);

private:
    static void renderCell(QString &out, const Report::Cell &cell);
    static void renderSection(QString &out, const Report::Section &section);
    static void renderBody(QString &out, const Report::ParagraphsBody &body);
    static void renderBody(QString &out, const Report::ListBody &body);
    static void renderBody(QString &out, const Report::TableBody &body);
};

#endif // REPORTPRESS_MARKUPRENDERER_H
