#include "modelstore.h"
#include "errors.h"

#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace {

QMutex &downloadLock()
{
    static QMutex lock;
    return lock;
}

constexpr int kDownloadTimeoutMs = 120000;

}

ModelStore::ModelStore(const QString &modelsDir)
    : m_modelsDir(modelsDir), m_downloadBase("https://huggingface.co")
{
}

ModelStore::ModelRef ModelStore::resolve(const QString &modelId)
{
    const QString id = modelId.trimmed();
    if (id.isEmpty()) {
        throw ModelUnavailableError("Empty model id.");
    }

    const QStringList parts = id.split('/');
    if (parts.size() == 1) {
        return {kDefaultRepo, QString("ggml-%1.bin").arg(id)};
    }
    if (parts.size() >= 3 && !parts[0].isEmpty() && !parts[1].isEmpty() && !parts.last().isEmpty()) {
        return {parts[0] + '/' + parts[1], parts.mid(2).join('/')};
    }
    throw ModelUnavailableError(QString("Model id does not name a file: %1").arg(modelId));
}

QString ModelStore::directoryName(const QString &modelId)
{
    return QString(modelId).replace('/', "__");
}

QStringList ModelStore::knownModels()
{
    return {
        "tiny", "tiny.en",
        "base", "base.en",
        "small", "small.en",
        "medium", "medium.en",
        "large-v3", "large-v3-turbo",
    };
}

QString ModelStore::authToken()
{
    QString token = qEnvironmentVariable("HF_TOKEN");
    if (token.isEmpty()) token = qEnvironmentVariable("HUGGINGFACE_HUB_TOKEN");
    return token;
}

QUrl ModelStore::downloadUrl(const QString &modelId) const
{
    const ModelRef ref = resolve(modelId);
    QString base = m_downloadBase;
    while (base.endsWith('/')) base.chop(1);
    return QUrl(QString("%1/%2/resolve/main/%3").arg(base, ref.repo, ref.file));
}

QString ModelStore::modelDir(const QString &modelId) const
{
    return QDir(m_modelsDir).filePath(directoryName(modelId));
}

QString ModelStore::modelFilePath(const QString &modelId) const
{
    const ModelRef ref = resolve(modelId);
    return QDir(modelDir(modelId)).filePath(QFileInfo(ref.file).fileName());
}

bool ModelStore::isDownloaded(const QString &modelId) const
{
    try {
        const QFileInfo info(modelFilePath(modelId));
        return info.isFile() && info.size() > 0;
    } catch (const ModelUnavailableError &) {
        return false;
    }
}

QStringList ModelStore::downloadedModels() const
{
    QStringList result;
    const QDir dir(m_modelsDir);
    if (!dir.exists()) return result;

    for (const QString &entry : dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name)) {
        const QString id = QString(entry).replace("__", "/");
        if (isDownloaded(id)) result << id;
    }
    return result;
}

bool ModelStore::deleteModel(const QString &modelId)
{
    QDir target(modelDir(modelId));
    if (!target.exists()) return false;
    const bool ok = target.removeRecursively();
    qInfo() << "Deleted model" << modelId << (ok ? "" : "(partially)");
    return ok;
}

QString ModelStore::ensureModel(const QString &modelId)
{
    QMutexLocker locker(&downloadLock());

    const QString dest = modelFilePath(modelId);
    if (isDownloaded(modelId)) {
        return dest;
    }

    if (!QDir().mkpath(modelDir(modelId))) {
        throw ModelUnavailableError(QString("Cannot create model directory %1").arg(modelDir(modelId)));
    }

    const QUrl url = downloadUrl(modelId);
    qInfo() << "Downloading model" << modelId << "from" << url.toString();
    download(url, dest);
    qInfo() << "Model downloaded:" << dest;
    return dest;
}

void ModelStore::download(const QUrl &url, const QString &dest)
{
    const QString partPath = dest + ".part";
    QFile file(partPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ModelUnavailableError(QString("Error opening file for writing at: %1").arg(partPath));
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setTransferTimeout(kDownloadTimeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    const QString token = authToken();
    if (!token.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + token.toUtf8());
    }

    QNetworkReply *reply = manager.get(request);
    bool writeFailed = false;
    QObject::connect(reply, &QNetworkReply::readyRead, [&]() {
        const QByteArray chunk = reply->readAll();
        if (file.write(chunk) != chunk.size()) writeFailed = true;
    });

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();

    const QByteArray rest = reply->readAll();
    if (!rest.isEmpty() && file.write(rest) != rest.size()) writeFailed = true;
    file.close();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QString errorText = reply->errorString();
    const bool failed = reply->error() != QNetworkReply::NoError;
    reply->deleteLater();

    if (failed || writeFailed || file.size() == 0) {
        QFile::remove(partPath);
        qCritical() << "Download Error:" << status << errorText;
        throw ModelUnavailableError(QString("Model download failed: %1 %2")
                                        .arg(status).arg(failed ? errorText : QString("empty or unwritable file")));
    }

    QFile::remove(dest);
    if (!QFile::rename(partPath, dest)) {
        QFile::remove(partPath);
        throw ModelUnavailableError(QString("Cannot move downloaded model to %1").arg(dest));
    }
}
