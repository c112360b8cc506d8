/*
 * reportexporter.h --- One export: prepare resources, assemble, write PDF
 *
 * The only asynchronous step is ResourceLoader::prepare(); once it
 * resolves, layout, both assembly passes and PDF generation run on the
 * exporter's thread. A cancelled preparation yields a cancelled future
 * and no document.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_REPORTEXPORTER_H
#define REPORTPRESS_REPORTEXPORTER_H

#include <QByteArray>
#include <QDateTime>
#include <QFuture>
#include <QList>
#include <QObject>
#include <QString>

#include "contentmodel.h"
#include "exportnaming.h"
#include "pageassembler.h"
#include "reportmodel.h"
#include "resourceloader.h"
#include "textmeasurer.h"
#include "typography.h"

struct ExportResult {
    bool ok = false;
    QString errorString;
    QByteArray pdf;
    QString fileName;     // suggested name, see ExportNaming
    int pageCount = 0;
    QString checksum;     // checksum shown in the header, if any
};

class ReportExporter : public QObject
{
    Q_OBJECT

public:
    ReportExporter(ResourceLoader &loader, const Typography &typography,
                   const Report::BrandingConfig &branding, QObject *parent = nullptr);

    QFuture<ExportResult> exportReport(const Report::Payload &payload,
                                       const Report::GeneratedContent &content,
                                       const Report::RenderedReport &rendered);

    QFuture<ExportResult> exportResults(const QList<Report::ResultEntry> &results,
                                        Report::ResultMode mode,
                                        const QDateTime &generatedAt);

    // Synchronous tail of an export, once the drawing context is known.
    ExportResult exportBlocks(const QList<Content::LayoutBlock> &blocks,
                              const DrawingContext &context,
                              const PageAssembler::HeaderInfo &header,
                              ExportNaming::Suffix suffix) const;

private:
    QFuture<ExportResult> run(const QList<Content::LayoutBlock> &blocks,
                              const PageAssembler::HeaderInfo &header,
                              ExportNaming::Suffix suffix);

    ResourceLoader &m_loader;
    Typography m_typography;
    Report::BrandingConfig m_branding;
    Layout::FontMetricsMeasurer m_measurer;
};

#endif // REPORTPRESS_REPORTEXPORTER_H
