/*
 * contentbuilder.h --- Structured report -> Content::LayoutBlock list
 *
 * Walks the same resolved sections as MarkupRenderer, so the exported
 * pages show exactly the text of the canonical markup.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_CONTENTBUILDER_H
#define REPORTPRESS_CONTENTBUILDER_H

#include <QList>

#include "contentmodel.h"
#include "reportmodel.h"
#include "reportresolver.h"

class ContentBuilder
{
public:
    QList<Content::LayoutBlock> build(const Report::Payload &payload,
                                      const Report::GeneratedContent &content);

    // One titled entry per result; Latest keeps only the last one.
    QList<Content::LayoutBlock> buildResults(const QList<Report::ResultEntry> &results,
                                             Report::ResultMode mode);

private:
    void appendSection(const Report::Section &section);
    void appendBody(const Report::ParagraphsBody &body);
    void appendBody(const Report::ListBody &body);
    void appendBody(const Report::TableBody &body);
    void appendParagraphs(const QString &text);

    void appendBlock(Content::LayoutBlock block);
    void appendSeparator(bool rule);

    QList<Content::LayoutBlock> m_blocks;
};

#endif // REPORTPRESS_CONTENTBUILDER_H
