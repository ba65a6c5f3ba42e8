#ifndef MODELSTORE_H
#define MODELSTORE_H

#include <QString>
#include <QStringList>
#include <QUrl>

// Local cache of ggml model files, one directory per model id.
//
// Ids are either a bare whisper.cpp name ("base.en", resolved to
// ggerganov/whisper.cpp ggml-base.en.bin) or a full Hugging Face file
// reference "owner/repo/file.bin".
class ModelStore
{
public:
    static constexpr const char *kDefaultModelId = "base.en";
    static constexpr const char *kDefaultRepo = "ggerganov/whisper.cpp";

    struct ModelRef
    {
        QString repo;
        QString file;
    };

    explicit ModelStore(const QString &modelsDir);

    QString modelsDir() const { return m_modelsDir; }

    // Defaults to https://huggingface.co
    void setDownloadBase(const QString &base) { m_downloadBase = base; }
    QString downloadBase() const { return m_downloadBase; }

    // Throws ModelUnavailableError for ids that name no file.
    static ModelRef resolve(const QString &modelId);
    static QString directoryName(const QString &modelId);
    static QStringList knownModels();
    // HF_TOKEN, then HUGGINGFACE_HUB_TOKEN.
    static QString authToken();

    QUrl downloadUrl(const QString &modelId) const;
    QString modelDir(const QString &modelId) const;
    QString modelFilePath(const QString &modelId) const;

    bool isDownloaded(const QString &modelId) const;
    QStringList downloadedModels() const;
    bool deleteModel(const QString &modelId);

    // Downloads the model file unless it is already present and returns its
    // path. All downloads in the process are serialized on one lock.
    // Throws ModelUnavailableError.
    QString ensureModel(const QString &modelId);

private:
    void download(const QUrl &url, const QString &dest);

    QString m_modelsDir;
    QString m_downloadBase;
};

#endif // MODELSTORE_H
