/*
 * reportmodel.cpp --- RenderedReport and JSON conversion for report inputs
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportmodel.h"
#include "fingerprint.h"

#include <QDebug>
#include <QJsonValue>

namespace Report {

RenderedReport::RenderedReport(const QString &markup, const QDateTime &createdAt)
    : m_markup(markup)
    , m_checksum(Fingerprint::compute(markup))
    , m_createdAt(createdAt)
{
}

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

// Missing and null keys are both "absent". Values of the wrong type are a
// content error: logged and treated as absent so a placeholder renders.
static std::optional<QString> optionalString(const QJsonObject &obj,
                                             const QString &key)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return std::nullopt;
    if (v.isString())
        return v.toString();
    if (v.isDouble())
        return QString::number(v.toDouble());

    qWarning() << "Report: ignoring non-text value for" << key;
    return std::nullopt;
}

static std::optional<QStringList> optionalStringList(const QJsonObject &obj,
                                                     const QString &key)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return std::nullopt;
    if (!v.isArray()) {
        qWarning() << "Report: expected an array for" << key;
        return std::nullopt;
    }

    QStringList list;
    const QJsonArray arr = v.toArray();
    for (const QJsonValue &item : arr)
        list.append(item.isString() ? item.toString() : QString());
    return list;
}

static void putString(QJsonObject &obj, const QString &key,
                      const std::optional<QString> &value)
{
    if (value)
        obj[key] = *value;
}

static void putStringList(QJsonObject &obj, const QString &key,
                          const std::optional<QStringList> &value)
{
    if (value)
        obj[key] = QJsonArray::fromStringList(*value);
}

static TimelineEntry timelineEntryFromJson(const QJsonObject &obj)
{
    TimelineEntry e;
    e.milestone = optionalString(obj, QStringLiteral("milestone"));
    e.owner     = optionalString(obj, QStringLiteral("owner"));
    e.dueDate   = optionalString(obj, QStringLiteral("dueDate"));
    e.notes     = optionalString(obj, QStringLiteral("notes"));
    return e;
}

static QJsonObject timelineEntryToJson(const TimelineEntry &e)
{
    QJsonObject obj;
    putString(obj, QStringLiteral("milestone"), e.milestone);
    putString(obj, QStringLiteral("owner"), e.owner);
    putString(obj, QStringLiteral("dueDate"), e.dueDate);
    putString(obj, QStringLiteral("notes"), e.notes);
    return obj;
}

static RiskEntry riskEntryFromJson(const QJsonObject &obj)
{
    RiskEntry e;
    e.risk       = optionalString(obj, QStringLiteral("risk"));
    e.severity   = optionalString(obj, QStringLiteral("severity"));
    e.likelihood = optionalString(obj, QStringLiteral("likelihood"));
    e.mitigation = optionalString(obj, QStringLiteral("mitigation"));
    return e;
}

static QJsonObject riskEntryToJson(const RiskEntry &e)
{
    QJsonObject obj;
    putString(obj, QStringLiteral("risk"), e.risk);
    putString(obj, QStringLiteral("severity"), e.severity);
    putString(obj, QStringLiteral("likelihood"), e.likelihood);
    putString(obj, QStringLiteral("mitigation"), e.mitigation);
    return obj;
}

// ---------------------------------------------------------------------------
// Payload
// ---------------------------------------------------------------------------

Payload payloadFromJson(const QJsonObject &obj)
{
    Payload p;
    p.entityName   = optionalString(obj, QStringLiteral("entityName"));
    p.entityType   = optionalString(obj, QStringLiteral("entityType"));
    p.jurisdiction = optionalString(obj, QStringLiteral("jurisdiction"));
    p.filingType   = optionalString(obj, QStringLiteral("filingType"));
    p.deadline     = optionalString(obj, QStringLiteral("deadline"));
    return p;
}

QJsonObject payloadToJson(const Payload &payload)
{
    QJsonObject obj;
    putString(obj, QStringLiteral("entityName"), payload.entityName);
    putString(obj, QStringLiteral("entityType"), payload.entityType);
    putString(obj, QStringLiteral("jurisdiction"), payload.jurisdiction);
    putString(obj, QStringLiteral("filingType"), payload.filingType);
    putString(obj, QStringLiteral("deadline"), payload.deadline);
    return obj;
}

// ---------------------------------------------------------------------------
// GeneratedContent
// ---------------------------------------------------------------------------

GeneratedContent contentFromJson(const QJsonObject &obj)
{
    GeneratedContent c;
    c.summary         = optionalString(obj, QStringLiteral("summary"));
    c.checklist       = optionalStringList(obj, QStringLiteral("checklist"));
    c.recommendations = optionalStringList(obj, QStringLiteral("recommendations"));
    c.references      = optionalStringList(obj, QStringLiteral("references"));

    const QJsonValue timeline = obj.value(QLatin1String("timeline"));
    if (timeline.isArray()) {
        QList<TimelineEntry> entries;
        for (const QJsonValue &v : timeline.toArray())
            entries.append(timelineEntryFromJson(v.toObject()));
        c.timeline = entries;
    } else if (!timeline.isUndefined() && !timeline.isNull()) {
        qWarning() << "Report: expected an array for timeline";
    }

    const QJsonValue risks = obj.value(QLatin1String("riskMatrix"));
    if (risks.isArray()) {
        QList<RiskEntry> entries;
        for (const QJsonValue &v : risks.toArray())
            entries.append(riskEntryFromJson(v.toObject()));
        c.riskMatrix = entries;
    } else if (!risks.isUndefined() && !risks.isNull()) {
        qWarning() << "Report: expected an array for riskMatrix";
    }

    return c;
}

QJsonObject contentToJson(const GeneratedContent &content)
{
    QJsonObject obj;
    putString(obj, QStringLiteral("summary"), content.summary);
    putStringList(obj, QStringLiteral("checklist"), content.checklist);

    if (content.timeline) {
        QJsonArray arr;
        for (const TimelineEntry &e : *content.timeline)
            arr.append(timelineEntryToJson(e));
        obj[QLatin1String("timeline")] = arr;
    }

    if (content.riskMatrix) {
        QJsonArray arr;
        for (const RiskEntry &e : *content.riskMatrix)
            arr.append(riskEntryToJson(e));
        obj[QLatin1String("riskMatrix")] = arr;
    }

    putStringList(obj, QStringLiteral("recommendations"), content.recommendations);
    putStringList(obj, QStringLiteral("references"), content.references);
    return obj;
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

QList<ResultEntry> resultsFromJson(const QJsonArray &array)
{
    QList<ResultEntry> results;
    for (const QJsonValue &v : array) {
        ResultEntry entry;
        if (v.isString()) {
            entry.text = v.toString();
        } else {
            const QJsonObject obj = v.toObject();
            entry.title = obj.value(QLatin1String("title")).toString();
            entry.text  = obj.value(QLatin1String("text")).toString();
        }
        results.append(entry);
    }
    return results;
}

} // namespace Report
