/*
 * test_pdfexporter.cpp --- PDF output and the end-to-end export
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <memory>

#include "markuprenderer.h"
#include "pagerecorder.h"
#include "pdfexporter.h"
#include "reportexporter.h"
#include "testutils.h"

#include <poppler-qt6.h>

static QString pdfPageText(const QByteArray &pdf, int page)
{
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(pdf);
    if (!doc || page >= doc->numPages())
        return {};
    std::unique_ptr<Poppler::Page> p = doc->page(page);
    return p ? p->text(QRectF()) : QString();
}

static Render::PageDocument twoPageDocument()
{
    Render::PageRecorder recorder(QSizeF(595.0, 842.0));
    Render::FontSpec font;
    font.family = QStringLiteral("Helvetica");
    font.size = 12;

    recorder.addPage();
    recorder.drawText(QPointF(56, 100), QStringLiteral("First page"), font, Qt::black);
    recorder.drawLine(QPointF(56, 80), QPointF(539, 80), QColor(230, 236, 244), 0.5);
    recorder.addPage();
    recorder.drawText(QPointF(56, 100), QStringLiteral("Second page"), font, Qt::black);
    return recorder.document();
}

// MARK: - PdfExporter

TEST(PdfExporterTest, WritesPdfBytes) {
    PdfExporter exporter;
    PdfExportOptions options;
    options.title = QStringLiteral("Mini-Dashboard");
    exporter.setExportOptions(options);

    const QByteArray pdf = exporter.generate(twoPageDocument());
    ASSERT_FALSE(pdf.isEmpty()) << exporter.errorString().toStdString();
    EXPECT_TRUE(pdf.startsWith("%PDF-"));

    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(pdf);
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->numPages(), 2);
    EXPECT_TRUE(pdfPageText(pdf, 1).contains(QStringLiteral("Second page")));
}

TEST(PdfExporterTest, DocumentWithoutPagesFails) {
    PdfExporter exporter;
    EXPECT_TRUE(exporter.generate(Render::PageDocument{}).isEmpty());
    EXPECT_FALSE(exporter.errorString().isEmpty());
}

TEST(PdfExporterTest, WritesFileAtomically) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("out.pdf"));

    PdfExporter exporter;
    ASSERT_TRUE(exporter.generateToFile(twoPageDocument(), path));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_TRUE(file.read(5) == "%PDF-");

    EXPECT_FALSE(exporter.generateToFile(twoPageDocument(),
                                         dir.filePath(QStringLiteral("no/such/dir/out.pdf"))));
}

// MARK: - ReportExporter

TEST(ReportExporterTest, ExportsEmptyReportWithAllSections) {
    ResourceLoader loader;
    ReportExporter exporter(loader, Typography::preset(), Report::BrandingConfig{});

    const Report::Payload payload;
    const Report::GeneratedContent content;
    const QDateTime createdAt(QDate(2025, 3, 7), QTime(10, 0));
    const Report::RenderedReport rendered =
        MarkupRenderer::renderReport(payload, content, createdAt);

    QFuture<ExportResult> future = exporter.exportReport(payload, content, rendered);
    ASSERT_TRUE(waitFor(future));
    ASSERT_EQ(future.resultCount(), 1);

    const ExportResult result = future.result();
    ASSERT_TRUE(result.ok) << result.errorString.toStdString();
    EXPECT_GE(result.pageCount, 1);
    EXPECT_EQ(result.checksum, rendered.checksum());
    EXPECT_EQ(result.fileName, QStringLiteral("2025-03-07_YBG_YourBizGuru_Mini_Dashboard_Report.pdf"));
    EXPECT_TRUE(result.pdf.startsWith("%PDF-"));

    const QString firstPage = pdfPageText(result.pdf, 0);
    EXPECT_TRUE(firstPage.contains(QStringLiteral("Page 1 of %1").arg(result.pageCount)));
    EXPECT_TRUE(firstPage.contains(QStringLiteral("Powered by YourBizGuru.com")));
}

TEST(ReportExporterTest, LatestResultUsesResultSuffix) {
    ResourceLoader loader;
    ReportExporter exporter(loader, Typography::preset(), Report::BrandingConfig{});

    const QList<Report::ResultEntry> results = {
        {QStringLiteral("Grant search"), QStringLiteral("Three programs match.")},
        {QString(), QStringLiteral("Final answer.")},
    };
    QFuture<ExportResult> future = exporter.exportResults(
        results, Report::ResultMode::Latest, QDateTime(QDate(2024, 12, 1), QTime(8, 0)));
    ASSERT_TRUE(waitFor(future));
    ASSERT_EQ(future.resultCount(), 1);

    const ExportResult result = future.result();
    ASSERT_TRUE(result.ok) << result.errorString.toStdString();
    EXPECT_EQ(result.pageCount, 1);
    EXPECT_TRUE(result.checksum.isEmpty());
    EXPECT_TRUE(result.fileName.endsWith(QStringLiteral("_Latest_Result.pdf")));
}

TEST(ReportExporterTest, BackendFailureStopsExport) {
    Typography typography = Typography::preset();
    typography.fontFiles = {QStringLiteral("/nonexistent/font.ttf")};

    ResourceLoader loader;
    ReportExporter exporter(loader, typography, Report::BrandingConfig{});
    const QList<Report::ResultEntry> results = {{QString(), QStringLiteral("text")}};
    QFuture<ExportResult> future = exporter.exportResults(
        results, Report::ResultMode::All, QDateTime::currentDateTime());
    ASSERT_TRUE(waitFor(future));
    ASSERT_EQ(future.resultCount(), 1);

    const ExportResult result = future.result();
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.pdf.isEmpty());
    EXPECT_TRUE(result.errorString.startsWith(QStringLiteral("Export unavailable")));
}
