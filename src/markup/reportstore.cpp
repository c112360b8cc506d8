/*
 * reportstore.cpp --- Persisted {markup, checksum, createdAt} records
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportstore.h"
#include "fingerprint.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

#include <KLocalizedString>

ReportStore::ReportStore(const QString &directory, QObject *parent)
    : QObject(parent)
    , m_directory(directory)
{
}

QString ReportStore::directory() const
{
    QString dir = m_directory;
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
              + QStringLiteral("/reports");
    }
    QDir().mkpath(dir);
    return dir;
}

QString ReportStore::hashId(const QString &id) const
{
    QByteArray hash = QCryptographicHash::hash(id.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex().left(16));
}

QString ReportStore::recordPath(const QString &id) const
{
    return directory() + QLatin1Char('/') + hashId(id) + QStringLiteral(".json");
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

QJsonObject ReportStore::toJson(const Report::RenderedReport &report)
{
    QJsonObject obj;
    obj[QLatin1String("htmlContent")] = report.markup();
    obj[QLatin1String("checksum")] = report.checksum();
    obj[QLatin1String("checksumAlgorithm")] = QLatin1String(Fingerprint::kAlgorithm);
    obj[QLatin1String("createdAt")] = report.createdAt().toString(Qt::ISODateWithMs);
    return obj;
}

ReportStore::LoadResult ReportStore::fromJson(const QJsonObject &obj)
{
    LoadResult result;

    const QJsonValue html = obj.value(QLatin1String("htmlContent"));
    const QJsonValue checksum = obj.value(QLatin1String("checksum"));
    if (!html.isString() || !checksum.isString()) {
        result.status = Status::Malformed;
        return result;
    }

    result.htmlContent = html.toString();
    result.storedChecksum = checksum.toString();
    result.computedChecksum = Fingerprint::compute(result.htmlContent);
    result.createdAt = QDateTime::fromString(obj.value(QLatin1String("createdAt")).toString(),
                                             Qt::ISODateWithMs);

    const QString algorithm = obj.value(QLatin1String("checksumAlgorithm"))
                                  .toString(QLatin1String(Fingerprint::kAlgorithm));
    if (algorithm != QLatin1String(Fingerprint::kAlgorithm)
        || !Fingerprint::matches(result.htmlContent, result.storedChecksum)) {
        result.status = Status::IntegrityMismatch;
        return result;
    }

    result.status = Status::Ok;
    result.report.emplace(result.htmlContent, result.createdAt);
    return result;
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

bool ReportStore::save(const QString &id, const Report::RenderedReport &report)
{
    const QString path = recordPath(id);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "ReportStore: cannot write" << path << file.errorString();
        return false;
    }

    QJsonObject obj = toJson(report);
    obj[QLatin1String("id")] = id;
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "ReportStore: cannot write" << path << file.errorString();
        return false;
    }
    return true;
}

ReportStore::LoadResult ReportStore::load(const QString &id) const
{
    return loadFile(recordPath(id));
}

ReportStore::LoadResult ReportStore::loadFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return LoadResult{};

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "ReportStore: malformed record" << path << error.errorString();
        LoadResult result;
        result.status = Status::Malformed;
        return result;
    }

    LoadResult result = fromJson(doc.object());
    if (result.status == Status::IntegrityMismatch) {
        qWarning() << "ReportStore: checksum mismatch in" << path
                   << "stored" << result.storedChecksum
                   << "computed" << result.computedChecksum;
    }
    return result;
}

bool ReportStore::remove(const QString &id)
{
    return QFile::remove(recordPath(id));
}

QString ReportStore::statusString(Status status)
{
    switch (status) {
    case Status::Ok:                return i18nc("@info record status", "Record verified");
    case Status::NotFound:          return i18nc("@info record status", "Record not found");
    case Status::Malformed:         return i18nc("@info record status", "Record is malformed");
    case Status::IntegrityMismatch: return i18nc("@info record status",
                                                 "Record failed its integrity check");
    }
    return {};
}
