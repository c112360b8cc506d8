/*
 * resourceloader.h --- Asynchronous preparation of export resources
 *
 * prepare() resolves once the branding icon has been fetched (or has
 * failed) and the drawing backend is usable. A missing icon leaves the
 * icon area blank; an unusable backend makes the context invalid and
 * export must stop with its errorString.
 *
 * One loader is meant to live for the whole process: the backend is
 * loaded on the first prepare() and only re-checked for new font files.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPRESS_RESOURCELOADER_H
#define REPORTPRESS_RESOURCELOADER_H

#include <QFuture>
#include <QImage>
#include <QObject>
#include <QPromise>
#include <QString>
#include <QStringList>

#include <memory>

#include "reportmodel.h"
#include "typography.h"

class QNetworkAccessManager;
class QUrl;

struct DrawingContext {
    QImage icon;          // circle-masked; null = leave the icon area blank
    QString errorString;  // non-empty = export unavailable

    bool isValid() const { return errorString.isEmpty(); }
};

class ResourceLoader : public QObject
{
    Q_OBJECT

public:
    explicit ResourceLoader(QObject *parent = nullptr);
    ~ResourceLoader() override;

    QFuture<DrawingContext> prepare(const Report::BrandingConfig &branding,
                                    const Typography &typography);

    bool isBackendLoaded() const { return m_backendLoaded; }

    // Icon bitmap edge in pixels; drawn into an iconSize-point square.
    static constexpr int kIconPixels = 128;
    static constexpr int kIconTimeoutMs = 10000;

    // Scale to cover a pixelSize square and clip to the inscribed circle.
    static QImage circleMasked(const QImage &source, int pixelSize = kIconPixels);

    // Read and mask an icon from a local path or Qt resource (":/...").
    static QImage loadIconFile(const QString &path, int pixelSize = kIconPixels);

private:
    using PromisePtr = std::shared_ptr<QPromise<DrawingContext>>;

    bool ensureBackend(const Typography &typography, QString *errorString);
    void loadLocalIcon(const QString &path, const PromisePtr &promise);
    void fetchRemoteIcon(const QUrl &url, const PromisePtr &promise);
    static void finish(const PromisePtr &promise, const DrawingContext &context);

    QNetworkAccessManager *m_network = nullptr;
    bool m_backendLoaded = false;
    QStringList m_registeredFontFiles;
};

#endif // REPORTPRESS_RESOURCELOADER_H
