#ifndef TRANSCRIPTIONORCHESTRATOR_H
#define TRANSCRIPTIONORCHESTRATOR_H

#include <QObject>
#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QFutureSynchronizer>
#include <atomic>
#include "postprocessclient.h"
#include "segmenter.h"
#include "speechengine.h"

class ModelLifecycleManager;

struct TranscriptRecord
{
    QString id;
    QString text;           // what gets delivered: polished if that worked, raw otherwise
    QString originalText;
    QString polishedText;
    QString jsonPath;
};

Q_DECLARE_METATYPE(TranscriptRecord)

struct TranscriptionSettings
{
    int sampleRate = 16000;
    bool segmentOnSilence = true;
    SegmenterConfig segmenter;
    TranscribeOptions options;
};

// Turns a finished recording into a TranscriptRecord: segment, transcribe
// each segment, join, optionally post-process, persist next to the audio.
class TranscriptionOrchestrator : public QObject
{
    Q_OBJECT
public:
    TranscriptionOrchestrator(ModelLifecycleManager *models, PostprocessClient *postprocess,
                              QObject *parent = nullptr);
    ~TranscriptionOrchestrator();

    void setSettings(const TranscriptionSettings &settings);
    TranscriptionSettings settings() const;

    void setPostprocessConfig(const PostprocessConfig &config);
    PostprocessConfig postprocessConfig() const;

    // Blocking. Throws ModelUnavailableError or TranscriptionError; a failed
    // post-processing step only falls back to the raw text.
    TranscriptRecord run(const QString &audioPath, const QString &modelId);

    // Runs on the thread pool and reports through transcriptReady/transcriptionFailed.
    void runAsync(const QString &audioPath, const QString &modelId);
    void waitForIdle();

    int inFlight() const { return m_inFlight.load(); }
    bool isTranscribing() const { return m_inFlight.load() > 0; }

    // <stem>.json beside the audio file. Throws TranscriptionError.
    static QString writeTranscriptJson(const QString &audioPath, const TranscriptRecord &record);

signals:
    void transcriptReady(const TranscriptRecord &record);
    void transcriptionFailed(const QString &audioPath, const QString &error);
    void inFlightChanged(int count);

private:
    TranscriptRecord execute(const QString &audioPath, const QString &modelId);
    QString transcribeAudio(const QString &audioPath, const QString &modelId,
                            const TranscriptionSettings &settings);
    void beginRun();
    void endRun();

    ModelLifecycleManager *m_models;
    PostprocessClient *m_postprocess;

    mutable QMutex m_configMutex;
    TranscriptionSettings m_settings;
    PostprocessConfig m_postprocessConfig;

    std::atomic<int> m_inFlight{0};
    QFutureSynchronizer<void> m_tasks;
};

#endif // TRANSCRIPTIONORCHESTRATOR_H
