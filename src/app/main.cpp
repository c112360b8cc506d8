/*
 * main.cpp --- reportpress command-line front end
 *
 *   reportpress render <input.json> [--output FILE] [--store ID]
 *   reportpress export <input.json> [--mode report|latest|all] [--output-dir DIR] ...
 *   reportpress verify <record.json>
 *
 * <input.json> holds {"payload": {...}, "content": {...}} for reports and
 * {"results": [...]} for the result modes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFutureWatcher>
#include <QGuiApplication>
#include <QCommandLineParser>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QTextStream>
#include <QTimer>

#include <KAboutData>
#include <KLocalizedString>

#include <optional>

#include "brandingsettings.h"
#include "markuprenderer.h"
#include "reportexporter.h"
#include "reportmodel.h"
#include "reportstore.h"
#include "resourceloader.h"

static QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

static QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

static std::optional<QJsonObject> readJsonObject(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        err() << i18n("Cannot open %1: %2", path, file.errorString()) << Qt::endl;
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        err() << i18n("%1 is not a JSON object: %2", path, error.errorString()) << Qt::endl;
        return std::nullopt;
    }
    return doc.object();
}

static bool writeFile(const QString &path, const QByteArray &data)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        err() << i18n("Cannot write %1: %2", path, file.errorString()) << Qt::endl;
        return false;
    }
    file.write(data);
    if (!file.commit()) {
        err() << i18n("Cannot write %1: %2", path, file.errorString()) << Qt::endl;
        return false;
    }
    return true;
}

// Spin the event loop until @p future settles or @p timeoutMs elapses.
template<typename T>
static bool waitForFuture(const QFuture<T> &future, int timeoutMs)
{
    QEventLoop loop;
    QFutureWatcher<T> watcher;
    QObject::connect(&watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);

    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    watcher.setFuture(future);
    if (!future.isFinished()) {
        if (timeoutMs > 0)
            timer.start(timeoutMs);
        loop.exec();
    }
    return !timedOut;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int runRender(const QCommandLineParser &parser, const QString &inputPath)
{
    const std::optional<QJsonObject> input = readJsonObject(inputPath);
    if (!input)
        return 1;

    const Report::Payload payload =
        Report::payloadFromJson(input->value(QLatin1String("payload")).toObject());
    const Report::GeneratedContent content =
        Report::contentFromJson(input->value(QLatin1String("content")).toObject());

    const Report::RenderedReport rendered =
        MarkupRenderer::renderReport(payload, content, QDateTime::currentDateTimeUtc());

    const QString output = parser.value(QStringLiteral("output"));
    if (output.isEmpty()) {
        out() << rendered.markup() << Qt::endl;
    } else if (!writeFile(output, rendered.markup().toUtf8())) {
        return 1;
    }

    const QString storeId = parser.value(QStringLiteral("store"));
    if (!storeId.isEmpty()) {
        ReportStore store;
        if (!store.save(storeId, rendered)) {
            err() << i18n("Could not store report %1", storeId) << Qt::endl;
            return 1;
        }
        err() << i18n("Stored as %1", store.recordPath(storeId)) << Qt::endl;
    }

    err() << i18n("Checksum: %1", rendered.checksum()) << Qt::endl;
    return 0;
}

static int runExport(const QCommandLineParser &parser, const QString &inputPath)
{
    const std::optional<QJsonObject> input = readJsonObject(inputPath);
    if (!input)
        return 1;

    Report::BrandingConfig branding = BrandingSettings::loadBranding();
    if (parser.isSet(QStringLiteral("toolkit-name")))
        branding.toolkitName = parser.value(QStringLiteral("toolkit-name"));
    if (parser.isSet(QStringLiteral("icon")))
        branding.iconUrl = parser.value(QStringLiteral("icon"));
    if (parser.isSet(QStringLiteral("brand-line")))
        branding.brandLine = parser.value(QStringLiteral("brand-line"));
    if (parser.isSet(QStringLiteral("brand-code")))
        branding.brandCode = parser.value(QStringLiteral("brand-code"));

    Typography typography = BrandingSettings::loadTypography();
    if (parser.isSet(QStringLiteral("typography"))) {
        const QString value = parser.value(QStringLiteral("typography"));
        if (Typography::presetVersions().contains(value)) {
            typography = Typography::preset(value);
        } else if (!BrandingSettings::loadTypographyFile(value, &typography)) {
            err() << i18n("Cannot use typography %1", value) << Qt::endl;
            return 1;
        }
    }

    bool timeoutOk = false;
    const int timeoutMs = parser.value(QStringLiteral("timeout")).toInt(&timeoutOk);
    if (!timeoutOk || timeoutMs < 0) {
        err() << i18n("Invalid timeout: %1", parser.value(QStringLiteral("timeout"))) << Qt::endl;
        return 1;
    }

    ResourceLoader loader;
    ReportExporter exporter(loader, typography, branding);

    const QString mode = parser.value(QStringLiteral("mode"));
    QFuture<ExportResult> future;
    if (mode == QLatin1String("report")) {
        const Report::Payload payload =
            Report::payloadFromJson(input->value(QLatin1String("payload")).toObject());
        const Report::GeneratedContent content =
            Report::contentFromJson(input->value(QLatin1String("content")).toObject());
        const Report::RenderedReport rendered =
            MarkupRenderer::renderReport(payload, content, QDateTime::currentDateTime());
        future = exporter.exportReport(payload, content, rendered);
    } else if (mode == QLatin1String("latest") || mode == QLatin1String("all")) {
        const QList<Report::ResultEntry> results =
            Report::resultsFromJson(input->value(QLatin1String("results")).toArray());
        future = exporter.exportResults(results,
                                        mode == QLatin1String("latest")
                                            ? Report::ResultMode::Latest
                                            : Report::ResultMode::All,
                                        QDateTime::currentDateTime());
    } else {
        err() << i18n("Unknown export mode: %1", mode) << Qt::endl;
        return 1;
    }

    if (!waitForFuture(future, timeoutMs)) {
        future.cancel();
        err() << i18n("Export timed out after %1 ms", timeoutMs) << Qt::endl;
        return 1;
    }
    if (future.isCanceled() || future.resultCount() == 0) {
        err() << i18n("Export was cancelled") << Qt::endl;
        return 1;
    }

    const ExportResult result = future.result();
    if (!result.ok) {
        err() << result.errorString << Qt::endl;
        return 1;
    }

    const QDir dir(parser.value(QStringLiteral("output-dir")));
    const QString path = dir.filePath(result.fileName);
    if (!writeFile(path, result.pdf))
        return 1;

    out() << path << Qt::endl;
    err() << i18np("1 page", "%1 pages", result.pageCount) << Qt::endl;
    return 0;
}

static int runVerify(const QString &recordPath)
{
    const ReportStore::LoadResult result = ReportStore::loadFile(recordPath);
    out() << ReportStore::statusString(result.status) << Qt::endl;

    if (result.status == ReportStore::Status::IntegrityMismatch) {
        out() << i18n("Stored checksum: %1", result.storedChecksum) << Qt::endl;
        out() << i18n("Computed checksum: %1", result.computedChecksum) << Qt::endl;
    } else if (result.isOk()) {
        out() << i18n("Checksum: %1", result.storedChecksum) << Qt::endl;
    }
    return result.isOk() ? 0 : 1;
}

// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("reportpress");

    KAboutData aboutData(
        QStringLiteral("reportpress"),
        i18n("ReportPress"),
        QStringLiteral("0.1.0"),
        i18n("Renders compliance reports to canonical markup and paginated PDF"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("reportpress.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 i18n("One of: render, export, verify"));
    parser.addPositionalArgument(QStringLiteral("input"),
                                 i18n("Report JSON (render, export) or stored record (verify)"));
    parser.addOptions({
        {{QStringLiteral("o"), QStringLiteral("output")},
         i18n("Write the markup to <file> instead of standard output."), QStringLiteral("file")},
        {QStringLiteral("store"),
         i18n("Save the rendered report in the report store under <id>."), QStringLiteral("id")},
        {{QStringLiteral("m"), QStringLiteral("mode")},
         i18n("Export mode: report, latest or all."), QStringLiteral("mode"),
         QStringLiteral("report")},
        {{QStringLiteral("d"), QStringLiteral("output-dir")},
         i18n("Directory for the exported PDF."), QStringLiteral("dir"), QStringLiteral(".")},
        {QStringLiteral("toolkit-name"), i18n("Toolkit name shown in the header."),
         QStringLiteral("name")},
        {QStringLiteral("icon"), i18n("Header icon: file path, qrc: or http(s) URL."),
         QStringLiteral("url")},
        {QStringLiteral("brand-line"), i18n("Brand shown in the footer."), QStringLiteral("text")},
        {QStringLiteral("brand-code"), i18n("Short brand used in the file name."),
         QStringLiteral("code")},
        {QStringLiteral("typography"), i18n("Typography preset version or JSON file."),
         QStringLiteral("preset|file")},
        {QStringLiteral("timeout"), i18n("Give up preparing resources after <ms> milliseconds."),
         QStringLiteral("ms"), QStringLiteral("30000")},
    });
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2) {
        err() << i18n("Expected a command and one input file.") << Qt::endl;
        parser.showHelp(1);
    }

    const QString command = args.at(0);
    if (command == QLatin1String("render"))
        return runRender(parser, args.at(1));
    if (command == QLatin1String("export"))
        return runExport(parser, args.at(1));
    if (command == QLatin1String("verify"))
        return runVerify(args.at(1));

    err() << i18n("Unknown command: %1", command) << Qt::endl;
    return 1;
}
