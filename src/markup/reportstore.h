/*
 * reportstore.h --- Persisted {markup, checksum, createdAt} records
 *
 * Records are JSON files named after a hash of the report id. Loading
 * recomputes the fingerprint; a record whose markup no longer matches its
 * stored checksum is reported as IntegrityMismatch and is not repaired.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_REPORTSTORE_H
#define REPORTPRESS_REPORTSTORE_H

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <optional>

#include "reportmodel.h"

class ReportStore : public QObject
{
    Q_OBJECT

public:
    enum class Status {
        Ok,
        NotFound,
        Malformed,
        IntegrityMismatch,
    };

    struct LoadResult {
        Status status = Status::NotFound;
        QString htmlContent;
        QString storedChecksum;
        QString computedChecksum;
        QDateTime createdAt;
        std::optional<Report::RenderedReport> report;   // only when Ok

        bool isOk() const { return status == Status::Ok; }
    };

    // Empty @p directory = <AppDataLocation>/reports.
    explicit ReportStore(const QString &directory = QString(), QObject *parent = nullptr);

    QString directory() const;

    bool save(const QString &id, const Report::RenderedReport &report);
    LoadResult load(const QString &id) const;
    bool remove(const QString &id);

    QString recordPath(const QString &id) const;

    static QJsonObject toJson(const Report::RenderedReport &report);
    static LoadResult fromJson(const QJsonObject &obj);
    static LoadResult loadFile(const QString &path);

    static QString statusString(Status status);

private:
    QString hashId(const QString &id) const;

    QString m_directory;
};

#endif // REPORTPRESS_REPORTSTORE_H
