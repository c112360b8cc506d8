/*
 * pdfexporter.h --- Recorded pages -> PDF via QPdfWriter
 *
 * The writer only moves forward, so it is fed a finished PageDocument:
 * every page already carries its header, body and footer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_PDFEXPORTER_H
#define REPORTPRESS_PDFEXPORTER_H

#include <QByteArray>
#include <QString>

#include "drawcommand.h"
#include "pdfexportoptions.h"

class QIODevice;

class PdfExporter {
public:
    PdfExporter() = default;

    void setExportOptions(const PdfExportOptions &opts) { m_options = opts; }
    const PdfExportOptions &exportOptions() const { return m_options; }

    // Empty on failure or for a document without pages.
    QByteArray generate(const Render::PageDocument &document) const;
    bool generateToFile(const Render::PageDocument &document, const QString &filePath) const;

    QString errorString() const { return m_errorString; }

private:
    bool write(const Render::PageDocument &document, QIODevice *device) const;

    PdfExportOptions m_options;
    mutable QString m_errorString;
};

#endif // REPORTPRESS_PDFEXPORTER_H
