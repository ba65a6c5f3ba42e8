#include "transcriptionorchestrator.h"
#include "errors.h"
#include "modellifecyclemanager.h"
#include "wavfile.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QScopeGuard>
#include <QStringList>
#include <QtConcurrent/QtConcurrentRun>

TranscriptionOrchestrator::TranscriptionOrchestrator(ModelLifecycleManager *models,
                                                     PostprocessClient *postprocess,
                                                     QObject *parent)
    : QObject(parent), m_models(models), m_postprocess(postprocess)
{
    qRegisterMetaType<TranscriptRecord>();
}

TranscriptionOrchestrator::~TranscriptionOrchestrator()
{
    m_tasks.waitForFinished();
}

void TranscriptionOrchestrator::setSettings(const TranscriptionSettings &settings)
{
    QMutexLocker locker(&m_configMutex);
    m_settings = settings;
}

TranscriptionSettings TranscriptionOrchestrator::settings() const
{
    QMutexLocker locker(&m_configMutex);
    return m_settings;
}

void TranscriptionOrchestrator::setPostprocessConfig(const PostprocessConfig &config)
{
    QMutexLocker locker(&m_configMutex);
    m_postprocessConfig = config;
}

PostprocessConfig TranscriptionOrchestrator::postprocessConfig() const
{
    QMutexLocker locker(&m_configMutex);
    return m_postprocessConfig;
}

void TranscriptionOrchestrator::beginRun()
{
    emit inFlightChanged(++m_inFlight);
}

void TranscriptionOrchestrator::endRun()
{
    emit inFlightChanged(--m_inFlight);
}

TranscriptRecord TranscriptionOrchestrator::run(const QString &audioPath, const QString &modelId)
{
    beginRun();
    auto cleanup = qScopeGuard([this]() { endRun(); });
    return execute(audioPath, modelId);
}

void TranscriptionOrchestrator::runAsync(const QString &audioPath, const QString &modelId)
{
    // Counted before dispatch so status reads "transcribing" right away.
    beginRun();
    m_tasks.addFuture(QtConcurrent::run([this, audioPath, modelId]() {
        auto cleanup = qScopeGuard([this]() { endRun(); });
        try {
            const TranscriptRecord record = execute(audioPath, modelId);
            emit transcriptReady(record);
        } catch (const std::exception &e) {
            qCritical() << "Transcription failed:" << e.what();
            emit transcriptionFailed(audioPath, QString::fromUtf8(e.what()));
        }
    }));
}

void TranscriptionOrchestrator::waitForIdle()
{
    m_tasks.waitForFinished();
}

TranscriptRecord TranscriptionOrchestrator::execute(const QString &audioPath, const QString &modelId)
{
    const TranscriptionSettings current = settings();
    const PostprocessConfig postprocess = postprocessConfig();

    m_models->markUsed(modelId);
    const QString raw = transcribeAudio(audioPath, modelId, current);

    TranscriptRecord record;
    record.id = QFileInfo(audioPath).completeBaseName();
    record.text = raw;
    record.originalText = raw;

    if (!raw.isEmpty() && postprocess.enabled && m_postprocess) {
        try {
            record.text = m_postprocess->rewrite(raw, postprocess);
            record.polishedText = record.text;
        } catch (const std::exception &e) {
            qWarning() << "Post-processing failed:" << e.what();
        }
    }

    record.jsonPath = writeTranscriptJson(audioPath, record);
    qInfo() << "Saved transcript:" << record.jsonPath;
    return record;
}

QString TranscriptionOrchestrator::transcribeAudio(const QString &audioPath, const QString &modelId,
                                                   const TranscriptionSettings &settings)
{
    if (settings.segmentOnSilence) {
        const std::optional<QVector<float>> audio = WavFile::readMono16(audioPath, settings.sampleRate);
        if (audio) {
            const Segmenter segmenter(settings.segmenter);
            const QVector<Segment> segments = segmenter.split(*audio, settings.sampleRate);
            qDebug() << "Transcribing" << segments.size() << "segments of" << audioPath;

            QStringList texts;
            for (const Segment &seg : segments) {
                if (seg.length() <= 0) continue;
                const QVector<float> chunk = audio->mid(static_cast<int>(seg.start),
                                                        static_cast<int>(seg.length()));
                const QString text = m_models->transcribe(modelId, chunk, settings.sampleRate,
                                                          settings.options).trimmed();
                if (!text.isEmpty()) texts << text;
            }
            return texts.join(' ').trimmed();
        }
        qDebug() << "Audio is not mono 16-bit at" << settings.sampleRate << "Hz, skipping segmentation";
    }
    return m_models->transcribeFile(modelId, audioPath, settings.options).trimmed();
}

QString TranscriptionOrchestrator::writeTranscriptJson(const QString &audioPath, const TranscriptRecord &record)
{
    const QFileInfo info(audioPath);
    const QString jsonPath = info.dir().filePath(info.completeBaseName() + ".json");

    QJsonObject payload;
    payload["id"] = info.completeBaseName();
    payload["text"] = record.text;
    payload["original_text"] = record.originalText;
    payload["polished_text"] = record.polishedText;

    QFile file(jsonPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw TranscriptionError(QString("Cannot write transcript %1: %2").arg(jsonPath, file.errorString()));
    }
    const QByteArray bytes = QJsonDocument(payload).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        throw TranscriptionError(QString("Cannot write transcript %1: %2").arg(jsonPath, file.errorString()));
    }
    return jsonPath;
}
