/*
 * reportmodel.h --- Structured report types and the rendered report value
 *
 * Every user-supplied or generated field is optional. An absent list is
 * distinct from an empty one: absence renders a pending marker, an empty
 * list renders a single default row or item.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_REPORTMODEL_H
#define REPORTPRESS_REPORTMODEL_H

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace Report {

// --- Inputs ---

struct Payload {
    std::optional<QString> entityName;
    std::optional<QString> entityType;
    std::optional<QString> jurisdiction;
    std::optional<QString> filingType;
    std::optional<QString> deadline;   // ISO date when well-formed, free text otherwise
};

struct TimelineEntry {
    std::optional<QString> milestone;
    std::optional<QString> owner;
    std::optional<QString> dueDate;
    std::optional<QString> notes;
};

struct RiskEntry {
    std::optional<QString> risk;
    std::optional<QString> severity;
    std::optional<QString> likelihood;
    std::optional<QString> mitigation;
};

struct GeneratedContent {
    std::optional<QString> summary;
    std::optional<QStringList> checklist;
    std::optional<QList<TimelineEntry>> timeline;
    std::optional<QList<RiskEntry>> riskMatrix;
    std::optional<QStringList> recommendations;
    std::optional<QStringList> references;
};

struct BrandingConfig {
    QString toolkitName = QStringLiteral("YourBizGuru Mini-Dashboard");
    QString iconUrl;
    QString brandLine = QStringLiteral("YourBizGuru.com");
    QString brandCode = QStringLiteral("YBG");   // short brand used in file names
};

// A plain-text result exported by the "latest" and "all" result modes.
struct ResultEntry {
    QString title;   // empty = "Result N"
    QString text;
};

enum class ResultMode {
    Latest,   // only the most recent entry
    All,
};

// --- Rendered output ---

// Immutable {markup, checksum, createdAt}. The checksum is computed once,
// by the constructor, so it always matches the markup it was built from.
class RenderedReport
{
public:
    RenderedReport(const QString &markup, const QDateTime &createdAt);

    const QString &markup() const { return m_markup; }
    const QString &checksum() const { return m_checksum; }
    const QDateTime &createdAt() const { return m_createdAt; }

private:
    QString m_markup;
    QString m_checksum;
    QDateTime m_createdAt;
};

// --- JSON ---

Payload payloadFromJson(const QJsonObject &obj);
QJsonObject payloadToJson(const Payload &payload);

GeneratedContent contentFromJson(const QJsonObject &obj);
QJsonObject contentToJson(const GeneratedContent &content);

QList<ResultEntry> resultsFromJson(const QJsonArray &array);

} // namespace Report

#endif // REPORTPRESS_REPORTMODEL_H
