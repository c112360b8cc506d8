/*
 * reportexporter.cpp --- One export: prepare resources, assemble, write PDF
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportexporter.h"
#include "contentbuilder.h"
#include "pdfexporter.h"

#include <QDebug>

ReportExporter::ReportExporter(ResourceLoader &loader, const Typography &typography,
                               const Report::BrandingConfig &branding, QObject *parent)
    : QObject(parent)
    , m_loader(loader)
    , m_typography(typography)
    , m_branding(branding)
{
}

QFuture<ExportResult> ReportExporter::exportReport(const Report::Payload &payload,
                                                   const Report::GeneratedContent &content,
                                                   const Report::RenderedReport &rendered)
{
    ContentBuilder builder;
    const QList<Content::LayoutBlock> blocks = builder.build(payload, content);

    PageAssembler::HeaderInfo header;
    header.title = m_branding.toolkitName;
    header.generatedAt = rendered.createdAt();
    header.checksum = rendered.checksum();
    header.brandLine = m_branding.brandLine;

    return run(blocks, header, ExportNaming::Suffix::Report);
}

QFuture<ExportResult> ReportExporter::exportResults(const QList<Report::ResultEntry> &results,
                                                    Report::ResultMode mode,
                                                    const QDateTime &generatedAt)
{
    ContentBuilder builder;
    const QList<Content::LayoutBlock> blocks = builder.buildResults(results, mode);

    PageAssembler::HeaderInfo header;
    header.title = m_branding.toolkitName;
    header.generatedAt = generatedAt;
    header.brandLine = m_branding.brandLine;

    return run(blocks, header, ExportNaming::suffixFor(mode));
}

QFuture<ExportResult> ReportExporter::run(const QList<Content::LayoutBlock> &blocks,
                                          const PageAssembler::HeaderInfo &header,
                                          ExportNaming::Suffix suffix)
{
    return m_loader.prepare(m_branding, m_typography)
        .then(this, [this, blocks, header, suffix](const DrawingContext &context) {
            return exportBlocks(blocks, context, header, suffix);
        });
}

ExportResult ReportExporter::exportBlocks(const QList<Content::LayoutBlock> &blocks,
                                          const DrawingContext &context,
                                          const PageAssembler::HeaderInfo &header,
                                          ExportNaming::Suffix suffix) const
{
    ExportResult result;
    result.checksum = header.checksum;
    result.fileName = ExportNaming::fileName(m_branding, suffix, header.generatedAt.date());

    if (!context.isValid()) {
        result.errorString = context.errorString;
        return result;
    }

    PageAssembler assembler(m_typography, m_measurer);
    const Render::PageDocument document = assembler.assemble(blocks, context, header);

    PdfExportOptions options;
    options.title = header.title;
    options.creator = m_branding.toolkitName;

    PdfExporter exporter;
    exporter.setExportOptions(options);
    result.pdf = exporter.generate(document);
    if (result.pdf.isEmpty()) {
        result.errorString = exporter.errorString();
        return result;
    }

    result.pageCount = document.pageCount();
    result.ok = true;
    qDebug() << "ReportExporter:" << result.fileName << result.pageCount << "pages";
    return result;
}
