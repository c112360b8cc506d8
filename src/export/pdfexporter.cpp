/*
 * pdfexporter.cpp --- Recorded pages -> PDF via QPdfWriter
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfexporter.h"
#include "paintersurface.h"

#include <QBuffer>
#include <QDebug>
#include <QMarginsF>
#include <QPageLayout>
#include <QPainter>
#include <QPdfWriter>
#include <QSaveFile>

#include <KLocalizedString>

QByteArray PdfExporter::generate(const Render::PageDocument &document) const
{
    QByteArray data;
    QBuffer buffer(&data);
    buffer.open(QIODevice::WriteOnly);
    if (!write(document, &buffer))
        return {};
    buffer.close();
    return data;
}

bool PdfExporter::generateToFile(const Render::PageDocument &document,
                                 const QString &filePath) const
{
    const QByteArray data = generate(document);
    if (data.isEmpty())
        return false;

    QSaveFile f(filePath);
    if (!f.open(QIODevice::WriteOnly)) {
        m_errorString = i18n("Cannot write %1: %2", filePath, f.errorString());
        qWarning() << "PdfExporter:" << m_errorString;
        return false;
    }
    f.write(data);
    if (!f.commit()) {
        m_errorString = i18n("Cannot write %1: %2", filePath, f.errorString());
        qWarning() << "PdfExporter:" << m_errorString;
        return false;
    }
    return true;
}

bool PdfExporter::write(const Render::PageDocument &document, QIODevice *device) const
{
    m_errorString.clear();
    if (document.pages.isEmpty()) {
        m_errorString = i18n("Nothing to export: the document has no pages");
        qWarning() << "PdfExporter:" << m_errorString;
        return false;
    }

    QPdfWriter writer(device);
    writer.setResolution(m_options.resolution);
    writer.setTitle(m_options.title);
    writer.setCreator(m_options.creator);
    writer.setPageLayout(QPageLayout(QPageSize(document.pageSize, QPageSize::Point),
                                     QPageLayout::Portrait, QMarginsF()));

    QPainter painter;
    if (!painter.begin(&writer)) {
        m_errorString = i18n("Cannot start the PDF writer");
        qWarning() << "PdfExporter:" << m_errorString;
        return false;
    }

    // Recorded coordinates are points; scale if the writer is not at 72 dpi.
    const qreal scale = m_options.resolution / 72.0;
    if (!qFuzzyCompare(scale, 1.0))
        painter.scale(scale, scale);

    Render::PainterSurface surface(&painter);
    for (int i = 0; i < document.pages.size(); ++i) {
        if (i > 0 && !writer.newPage()) {
            painter.end();
            m_errorString = i18n("Cannot add page %1 to the PDF", i + 1);
            qWarning() << "PdfExporter:" << m_errorString;
            return false;
        }
        Render::replay(document.pages[i], surface);
    }

    painter.end();
    return true;
}
