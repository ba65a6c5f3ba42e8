#ifndef MODELLIFECYCLEMANAGER_H
#define MODELLIFECYCLEMANAGER_H

#include <QObject>
#include <QMutex>
#include <QString>
#include <QTimer>
#include <QVector>
#include <QFutureSynchronizer>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include "speechengine.h"

class ModelStore;

// Owns the one loaded recognition model. Loads it on demand or ahead of time,
// and drops it again after a configurable idle period.
//
// Load and unload are serialized on a single mutex. Inference is not: each
// transcribe() call holds its own reference to the model, so an unload while
// inference runs only takes effect once that call returns.
class ModelLifecycleManager : public QObject
{
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;           // monotonic milliseconds
    using ActivityProbe = std::function<bool()>;     // true while recording or transcribing

    static constexpr qint64 kLowMemoryBytes = 16LL * 1024 * 1024 * 1024;
    static constexpr int kLowMemoryIdleMinutes = 15;

    ModelLifecycleManager(ModelStore *store, SpeechEngine *engine, QObject *parent = nullptr);
    ~ModelLifecycleManager();

    void setClock(Clock clock);
    void setActivityProbe(ActivityProbe probe);

    void setConfiguredModelId(const QString &modelId);
    QString configuredModelId() const;
    // Makes modelId the configured model and starts its background warmup.
    // Returns false when it already was the configured model.
    bool selectModel(const QString &modelId);

    // nullopt selects the memory based default; values <= 0 disable idle unload.
    void setIdleMinutes(std::optional<int> minutes);
    void setIdleThresholdMs(qint64 ms);
    qint64 idleThresholdMs() const;

    static qint64 totalMemoryBytes();
    static bool isLowMemory(qint64 totalBytes);
    static int defaultIdleMinutes(qint64 totalBytes);

    // Downloads if needed, then loads unless modelId is already active.
    // Throws ModelUnavailableError.
    void warmUp(const QString &modelId);
    // Only makes sure the files are on disk.
    QString prefetch(const QString &modelId);

    // Throws ModelUnavailableError or TranscriptionError.
    QString transcribe(const QString &modelId, const QVector<float> &samples, int sampleRate,
                       const TranscribeOptions &options);
    QString transcribeFile(const QString &modelId, const QString &audioPath,
                           const TranscribeOptions &options);

    void markUsed(const QString &modelId);

    // Timer entry point. Returns true if the model was released.
    bool idleUnload();
    void unload();

    bool isLoaded() const { return m_loaded.load(); }
    bool isLoading() const { return m_loading.load(); }
    QString loadedModelId() const;

    // Background download + warmup following the memory policy: on low memory
    // machines only the files are fetched and loading waits for first use.
    void startWarmup(const QString &modelId);
    void startWarmup(const QString &modelId, bool fullWarmup);
    void waitForBackgroundTasks();

signals:
    void loadingChanged(bool loading);
    void modelLoaded(const QString &modelId);
    void modelUnloaded(const QString &modelId);

private:
    std::shared_ptr<SpeechModel> acquire(const QString &modelId);
    void scheduleIdleCheck();
    void setLoading(bool loading);
    qint64 now() const;

    ModelStore *m_store;
    SpeechEngine *m_engine;

    mutable QMutex m_loadMutex;
    std::shared_ptr<SpeechModel> m_model;
    QString m_modelId;
    std::atomic<bool> m_loaded{false};
    std::atomic<int> m_swapsInProgress{0};

    std::atomic<bool> m_loading{false};
    std::atomic<int> m_warmupGeneration{0};

    mutable QMutex m_idleMutex;
    Clock m_clock;
    ActivityProbe m_activityProbe;
    QString m_configuredModelId;
    QString m_lastUsedModelId;
    qint64 m_lastUsedMs = 0;
    qint64 m_idleThresholdMs = 0;

    QTimer *m_idleTimer;
    QFutureSynchronizer<void> m_background;
};

#endif // MODELLIFECYCLEMANAGER_H
