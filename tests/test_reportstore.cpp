/*
 * test_reportstore.cpp --- Report record persistence and integrity checks
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "fingerprint.h"
#include "reportstore.h"

class ReportStoreTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    Report::RenderedReport sampleReport() const
    {
        return Report::RenderedReport(
            QStringLiteral("<section><h2>Executive Summary</h2><p>All clear.</p></section>"),
            QDateTime(QDate(2025, 4, 15), QTime(9, 30, 0, 250), Qt::UTC));
    }

    QTemporaryDir dir;
};

// MARK: - Round trip

TEST_F(ReportStoreTest, SavedRecordLoadsAndVerifies) {
    ReportStore store(dir.path());
    const Report::RenderedReport report = sampleReport();
    ASSERT_TRUE(store.save(QStringLiteral("report-42"), report));

    const ReportStore::LoadResult loaded = store.load(QStringLiteral("report-42"));
    ASSERT_TRUE(loaded.isOk());
    ASSERT_TRUE(loaded.report.has_value());
    EXPECT_EQ(loaded.report->markup(), report.markup());
    EXPECT_EQ(loaded.report->checksum(), report.checksum());
    EXPECT_EQ(loaded.createdAt, report.createdAt());
    EXPECT_EQ(loaded.storedChecksum, loaded.computedChecksum);
}

TEST_F(ReportStoreTest, RecordPathIsHashedInsideDirectory) {
    ReportStore store(dir.path());
    const QString path = store.recordPath(QStringLiteral("a/../weird id"));
    EXPECT_TRUE(path.startsWith(dir.path() + QLatin1Char('/')));
    EXPECT_TRUE(path.endsWith(QStringLiteral(".json")));
    EXPECT_EQ(path.mid(dir.path().size() + 1).size(), 16 + 5);
    EXPECT_NE(path, store.recordPath(QStringLiteral("other")));
}

TEST_F(ReportStoreTest, JsonCarriesAlgorithmName) {
    const QJsonObject obj = ReportStore::toJson(sampleReport());
    EXPECT_EQ(obj.value(QLatin1String("checksumAlgorithm")).toString(),
              QLatin1String(Fingerprint::kAlgorithm));
    EXPECT_EQ(obj.value(QLatin1String("checksum")).toString(), sampleReport().checksum());
}

// MARK: - Failures

TEST_F(ReportStoreTest, MissingRecordIsNotFound) {
    ReportStore store(dir.path());
    const ReportStore::LoadResult loaded = store.load(QStringLiteral("never-saved"));
    EXPECT_EQ(loaded.status, ReportStore::Status::NotFound);
    EXPECT_FALSE(loaded.report.has_value());
}

TEST_F(ReportStoreTest, TamperedMarkupFailsIntegrityCheck) {
    ReportStore store(dir.path());
    ASSERT_TRUE(store.save(QStringLiteral("report-42"), sampleReport()));

    const QString path = store.recordPath(QStringLiteral("report-42"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QJsonObject obj = QJsonDocument::fromJson(file.readAll()).object();
    file.close();

    obj[QLatin1String("htmlContent")] =
        obj.value(QLatin1String("htmlContent")).toString().replace(QStringLiteral("clear"),
                                                                   QStringLiteral("clean"));
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(QJsonDocument(obj).toJson());
    file.close();

    const ReportStore::LoadResult loaded = store.load(QStringLiteral("report-42"));
    EXPECT_EQ(loaded.status, ReportStore::Status::IntegrityMismatch);
    EXPECT_FALSE(loaded.report.has_value());
    EXPECT_NE(loaded.storedChecksum, loaded.computedChecksum);
}

TEST_F(ReportStoreTest, UnknownAlgorithmFailsIntegrityCheck) {
    QJsonObject obj = ReportStore::toJson(sampleReport());
    obj[QLatin1String("checksumAlgorithm")] = QStringLiteral("sha1");
    EXPECT_EQ(ReportStore::fromJson(obj).status, ReportStore::Status::IntegrityMismatch);
}

TEST_F(ReportStoreTest, NonJsonFileIsMalformed) {
    const QString path = dir.filePath(QStringLiteral("broken.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("<html>not a record</html>");
    file.close();

    EXPECT_EQ(ReportStore::loadFile(path).status, ReportStore::Status::Malformed);
}

TEST_F(ReportStoreTest, MissingFieldsAreMalformed) {
    QJsonObject obj;
    obj[QLatin1String("htmlContent")] = QStringLiteral("<p>x</p>");
    EXPECT_EQ(ReportStore::fromJson(obj).status, ReportStore::Status::Malformed);
}

TEST_F(ReportStoreTest, RemoveDeletesRecord) {
    ReportStore store(dir.path());
    ASSERT_TRUE(store.save(QStringLiteral("gone"), sampleReport()));
    EXPECT_TRUE(store.remove(QStringLiteral("gone")));
    EXPECT_EQ(store.load(QStringLiteral("gone")).status, ReportStore::Status::NotFound);
    EXPECT_FALSE(store.remove(QStringLiteral("gone")));
}
