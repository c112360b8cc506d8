/*
 * markuprenderer.cpp --- Canonical HTML rendering of a compliance report
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markuprenderer.h"

QString MarkupRenderer::escape(const QString &text)
{
    return text.toHtmlEscaped();
}

Report::RenderedReport MarkupRenderer::renderReport(const Report::Payload &payload,
                                                    const Report::GeneratedContent &content,
                                                    const QDateTime &createdAt)
{
    return Report::RenderedReport(render(payload, content), createdAt);
}

QString MarkupRenderer::render(const Report::Payload &payload,
                               const Report::GeneratedContent &content)
{
    const Report::ResolvedReport report = Report::resolve(payload, content);

    QString out;
    out += QLatin1String("<article class=\"compliance-report\">\n");

    // Header metadata
    out += QLatin1String("<header data-section=\"header\">\n<h1>");
    out += escape(report.title);
    out += QLatin1String("</h1>\n<p class=\"subtitle\">");
    renderCell(out, report.subtitle);
    out += QLatin1String("</p>\n<dl>\n");
    for (const Report::Field &field : report.fields) {
        out += QLatin1String("<dt>");
        out += escape(field.label);
        out += QLatin1String("</dt><dd>");
        renderCell(out, field.value);
        out += QLatin1String("</dd>\n");
    }
    out += QLatin1String("</dl>\n</header>\n");

    for (const Report::Section &section : report.sections)
        renderSection(out, section);

    out += QLatin1String("</article>\n");
    return out;
}

void MarkupRenderer::renderCell(QString &out, const Report::Cell &cell)
{
    if (cell.pending) {
        out += QLatin1String("<span class=\"pending\">");
        out += escape(cell.text);
        out += QLatin1String("</span>");
    } else {
        out += escape(cell.text);
    }
}

void MarkupRenderer::renderSection(QString &out, const Report::Section &section)
{
    out += QLatin1String("<section data-section=\"");
    out += escape(section.id);
    out += QLatin1String("\">\n<h2>");
    out += escape(section.title);
    out += QLatin1String("</h2>\n");

    std::visit([&out](const auto &body) { renderBody(out, body); }, section.body);

    if (section.note) {
        out += QLatin1String("<p class=\"note\">");
        renderCell(out, *section.note);
        out += QLatin1String("</p>\n");
    }

    out += QLatin1String("</section>\n");
}

void MarkupRenderer::renderBody(QString &out, const Report::ParagraphsBody &body)
{
    for (const Report::Cell &p : body.paragraphs) {
        out += QLatin1String("<p>");
        renderCell(out, p);
        out += QLatin1String("</p>\n");
    }
}

void MarkupRenderer::renderBody(QString &out, const Report::ListBody &body)
{
    QLatin1String open("<ul>\n");
    QLatin1String close("</ul>\n");
    if (body.kind == Report::ListBody::Ordered) {
        open = QLatin1String("<ol>\n");
        close = QLatin1String("</ol>\n");
    } else if (body.kind == Report::ListBody::Checklist) {
        open = QLatin1String("<ul class=\"checklist\">\n");
    }

    out += open;
    for (const Report::Cell &item : body.items) {
        out += QLatin1String("<li>");
        renderCell(out, item);
        out += QLatin1String("</li>\n");
    }
    out += close;
}

void MarkupRenderer::renderBody(QString &out, const Report::TableBody &body)
{
    out += QLatin1String("<table>\n<thead>\n<tr>");
    for (const QString &column : body.columns) {
        out += QLatin1String("<th>");
        out += escape(column);
        out += QLatin1String("</th>");
    }
    out += QLatin1String("</tr>\n</thead>\n<tbody>\n");

    for (const QList<Report::Cell> &row : body.rows) {
        out += body.defaultRow ? QLatin1String("<tr class=\"placeholder\">")
                               : QLatin1String("<tr>");
        for (const Report::Cell &cell : row) {
            out += QLatin1String("<td>");
            renderCell(out, cell);
            out += QLatin1String("</td>");
        }
        out += QLatin1String("</tr>\n");
    }
    out += QLatin1String("</tbody>\n</table>\n");
}
