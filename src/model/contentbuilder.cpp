/*
 * contentbuilder.cpp --- Structured report -> Content::LayoutBlock list
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentbuilder.h"

QList<Content::LayoutBlock> ContentBuilder::build(const Report::Payload &payload,
                                                  const Report::GeneratedContent &content)
{
    m_blocks.clear();

    const Report::ResolvedReport report = Report::resolve(payload, content);

    appendBlock(Content::Heading{1, report.title});
    appendBlock(Content::Heading{2, report.subtitle.text});
    for (const Report::Field &field : report.fields) {
        appendBlock(Content::Paragraph{
            field.label + QLatin1String(": ") + field.value.text,
            field.value.pending});
    }

    for (const Report::Section &section : report.sections) {
        appendSeparator(true);
        appendSection(section);
    }

    return std::move(m_blocks);
}

QList<Content::LayoutBlock> ContentBuilder::buildResults(const QList<Report::ResultEntry> &results,
                                                         Report::ResultMode mode)
{
    m_blocks.clear();

    QList<Report::ResultEntry> entries = results;
    if (mode == Report::ResultMode::Latest && !entries.isEmpty())
        entries = {entries.last()};

    for (int i = 0; i < entries.size(); ++i) {
        const Report::ResultEntry &entry = entries[i];
        if (i > 0)
            appendSeparator(false);

        const QString title = entry.title.trimmed().isEmpty()
            ? QStringLiteral("Result %1").arg(i + 1)
            : entry.title.trimmed();
        appendBlock(Content::Heading{1, title});
        appendParagraphs(entry.text);
    }

    return std::move(m_blocks);
}

void ContentBuilder::appendSection(const Report::Section &section)
{
    appendBlock(Content::Heading{1, section.title});

    std::visit([this](const auto &body) { appendBody(body); }, section.body);

    if (section.note) {
        appendSeparator(false);
        appendBlock(Content::Paragraph{section.note->text, section.note->pending});
    }
}

void ContentBuilder::appendBody(const Report::ParagraphsBody &body)
{
    for (int i = 0; i < body.paragraphs.size(); ++i) {
        if (i > 0)
            appendSeparator(false);
        const Report::Cell &p = body.paragraphs[i];
        appendBlock(Content::Paragraph{p.text, p.pending});
    }
}

void ContentBuilder::appendBody(const Report::ListBody &body)
{
    for (int i = 0; i < body.items.size(); ++i) {
        const Report::Cell &cell = body.items[i];
        Content::ListItem item;
        item.text = cell.text;
        item.pending = cell.pending;
        if (body.kind == Report::ListBody::Ordered)
            item.ordinal = i + 1;
        item.checkbox = (body.kind == Report::ListBody::Checklist);
        appendBlock(item);
    }
}

void ContentBuilder::appendBody(const Report::TableBody &body)
{
    appendBlock(Content::TableRow{body.columns, true});
    for (const QList<Report::Cell> &row : body.rows) {
        Content::TableRow tableRow;
        for (const Report::Cell &cell : row) {
            tableRow.cells.append(cell.text);
            tableRow.pending.append(cell.pending);
        }
        appendBlock(std::move(tableRow));
    }
}

void ContentBuilder::appendParagraphs(const QString &text)
{
    const QStringList paragraphs = Report::splitParagraphs(text);
    for (int i = 0; i < paragraphs.size(); ++i) {
        if (i > 0)
            appendSeparator(false);
        appendBlock(Content::Paragraph{paragraphs[i], false});
    }
}

void ContentBuilder::appendBlock(Content::LayoutBlock block)
{
    m_blocks.append(std::move(block));
}

// Runs of separators collapse into one; a rule wins over blank space.
void ContentBuilder::appendSeparator(bool rule)
{
    if (m_blocks.isEmpty())
        return;

    if (auto *last = std::get_if<Content::Separator>(&m_blocks.last())) {
        last->rule = last->rule || rule;
        return;
    }
    m_blocks.append(Content::Separator{rule});
}
