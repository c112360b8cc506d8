/*
 * resourceloader.cpp --- Asynchronous preparation of export resources
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "resourceloader.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFontDatabase>
#include <QFutureWatcher>
#include <QGuiApplication>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPainter>
#include <QPainterPath>
#include <QUrl>
#include <QtConcurrent>

#include <KLocalizedString>

ResourceLoader::ResourceLoader(QObject *parent)
    : QObject(parent)
{
}

ResourceLoader::~ResourceLoader() = default;

QFuture<DrawingContext> ResourceLoader::prepare(const Report::BrandingConfig &branding,
                                                const Typography &typography)
{
    auto promise = std::make_shared<QPromise<DrawingContext>>();
    QFuture<DrawingContext> future = promise->future();
    promise->start();

    QString error;
    if (!ensureBackend(typography, &error)) {
        qWarning() << "ResourceLoader:" << error;
        DrawingContext context;
        context.errorString = i18n("Export unavailable: %1", error);
        finish(promise, context);
        return future;
    }

    const QString iconUrl = branding.iconUrl.trimmed();
    if (iconUrl.isEmpty()) {
        finish(promise, DrawingContext{});
        return future;
    }

    const QUrl url(iconUrl);
    const QString scheme = url.scheme().toLower();
    if (scheme == QLatin1String("http") || scheme == QLatin1String("https"))
        fetchRemoteIcon(url, promise);
    else if (scheme == QLatin1String("file"))
        loadLocalIcon(url.toLocalFile(), promise);
    else if (scheme == QLatin1String("qrc"))
        loadLocalIcon(QLatin1Char(':') + url.path(), promise);
    else
        loadLocalIcon(iconUrl, promise);

    return future;
}

bool ResourceLoader::ensureBackend(const Typography &typography, QString *errorString)
{
    if (!m_backendLoaded) {
        // Font rasterisation and PDF painting need a GUI application.
        if (!qobject_cast<QGuiApplication *>(QCoreApplication::instance())) {
            *errorString = i18n("no graphical application instance is available for drawing");
            return false;
        }
        m_backendLoaded = true;
    }

    for (const QString &file : typography.fontFiles) {
        if (m_registeredFontFiles.contains(file))
            continue;
        if (QFontDatabase::addApplicationFont(file) < 0) {
            *errorString = i18n("cannot load font file %1", file);
            return false;
        }
        m_registeredFontFiles.append(file);
    }
    return true;
}

void ResourceLoader::loadLocalIcon(const QString &path, const PromisePtr &promise)
{
    // Decode off the GUI thread, publish back on it.
    auto *watcher = new QFutureWatcher<QImage>(this);
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [watcher, promise, path]() {
        DrawingContext context;
        context.icon = watcher->result();
        watcher->deleteLater();

        if (context.icon.isNull())
            qWarning() << "ResourceLoader: icon unavailable, leaving it blank:" << path;
        finish(promise, context);
    });
    watcher->setFuture(QtConcurrent::run(&ResourceLoader::loadIconFile, path, kIconPixels));
}

void ResourceLoader::fetchRemoteIcon(const QUrl &url, const PromisePtr &promise)
{
    if (!m_network)
        m_network = new QNetworkAccessManager(this);

    QNetworkRequest request(url);
    request.setTransferTimeout(kIconTimeoutMs);
    QNetworkReply *reply = m_network->get(request);

    connect(reply, &QNetworkReply::finished, this, [reply, promise, url]() {
        reply->deleteLater();

        DrawingContext context;
        if (reply->error() != QNetworkReply::NoError) {
            qWarning() << "ResourceLoader: icon download failed, leaving it blank:"
                       << url.toString() << reply->errorString();
        } else {
            QImage image;
            if (image.loadFromData(reply->readAll()))
                context.icon = circleMasked(image);
            else
                qWarning() << "ResourceLoader: icon is not a readable image:" << url.toString();
        }
        finish(promise, context);
    });
}

void ResourceLoader::finish(const PromisePtr &promise, const DrawingContext &context)
{
    // A cancelled export simply never sees a result.
    if (!promise->isCanceled())
        promise->addResult(context);
    promise->finish();
}

QImage ResourceLoader::loadIconFile(const QString &path, int pixelSize)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};

    const QByteArray data = file.readAll();
    QImage image;
    if (!image.loadFromData(data, QFileInfo(path).suffix().toLatin1().constData()))
        image.loadFromData(data);
    return circleMasked(image, pixelSize);
}

QImage ResourceLoader::circleMasked(const QImage &source, int pixelSize)
{
    if (source.isNull() || pixelSize <= 0)
        return {};

    const QImage scaled = source.scaled(pixelSize, pixelSize,
                                        Qt::KeepAspectRatioByExpanding,
                                        Qt::SmoothTransformation);

    QImage result(pixelSize, pixelSize, QImage::Format_ARGB32_Premultiplied);
    result.fill(Qt::transparent);

    QPainter painter(&result);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    QPainterPath clip;
    clip.addEllipse(QRectF(0, 0, pixelSize, pixelSize));
    painter.setClipPath(clip);
    painter.drawImage(QPointF((pixelSize - scaled.width()) / 2.0,
                              (pixelSize - scaled.height()) / 2.0),
                      scaled);
    painter.end();

    return result;
}
