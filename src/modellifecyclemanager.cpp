#include "modellifecyclemanager.h"
#include "errors.h"
#include "modelstore.h"
#include "wavfile.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentRun>
#include <climits>
#include <unistd.h>

namespace {

// Counts an in-progress load or unload for the idle check.
class SwapGuard
{
public:
    explicit SwapGuard(std::atomic<int> &counter) : m_counter(counter) { ++m_counter; }
    ~SwapGuard() { --m_counter; }

private:
    std::atomic<int> &m_counter;
};

}

ModelLifecycleManager::ModelLifecycleManager(ModelStore *store, SpeechEngine *engine, QObject *parent)
    : QObject(parent), m_store(store), m_engine(engine)
{
    QElapsedTimer monotonic;
    monotonic.start();
    m_clock = [monotonic]() { return monotonic.elapsed(); };

    m_idleTimer = new QTimer(this);
    m_idleTimer->setSingleShot(true);
    connect(m_idleTimer, &QTimer::timeout, this, [this]() { idleUnload(); });
}

ModelLifecycleManager::~ModelLifecycleManager()
{
    m_background.waitForFinished();
}

void ModelLifecycleManager::setClock(Clock clock)
{
    QMutexLocker locker(&m_idleMutex);
    m_clock = std::move(clock);
}

void ModelLifecycleManager::setActivityProbe(ActivityProbe probe)
{
    QMutexLocker locker(&m_idleMutex);
    m_activityProbe = std::move(probe);
}

void ModelLifecycleManager::setConfiguredModelId(const QString &modelId)
{
    QMutexLocker locker(&m_idleMutex);
    m_configuredModelId = modelId;
}

QString ModelLifecycleManager::configuredModelId() const
{
    QMutexLocker locker(&m_idleMutex);
    return m_configuredModelId;
}

bool ModelLifecycleManager::selectModel(const QString &modelId)
{
    {
        QMutexLocker locker(&m_idleMutex);
        if (m_configuredModelId == modelId) return false;
        m_configuredModelId = modelId;
    }
    qInfo() << "Model selected:" << modelId;
    startWarmup(modelId);
    return true;
}

void ModelLifecycleManager::setIdleMinutes(std::optional<int> minutes)
{
    const int resolved = minutes.value_or(defaultIdleMinutes(totalMemoryBytes()));
    setIdleThresholdMs(resolved <= 0 ? 0 : qint64(resolved) * 60 * 1000);
}

void ModelLifecycleManager::setIdleThresholdMs(qint64 ms)
{
    {
        QMutexLocker locker(&m_idleMutex);
        m_idleThresholdMs = qMax<qint64>(0, ms);
    }
    qInfo() << "Model idle unload threshold:" << qMax<qint64>(0, ms) / 1000 << "s";
    scheduleIdleCheck();
}

qint64 ModelLifecycleManager::idleThresholdMs() const
{
    QMutexLocker locker(&m_idleMutex);
    return m_idleThresholdMs;
}

qint64 ModelLifecycleManager::totalMemoryBytes()
{
    const long pages = sysconf(_SC_PHYS_PAGES);
    const long pageSize = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || pageSize <= 0) return 0;
    return qint64(pages) * pageSize;
}

bool ModelLifecycleManager::isLowMemory(qint64 totalBytes)
{
    return totalBytes > 0 && totalBytes < kLowMemoryBytes;
}

int ModelLifecycleManager::defaultIdleMinutes(qint64 totalBytes)
{
    return isLowMemory(totalBytes) ? kLowMemoryIdleMinutes : 0;
}

qint64 ModelLifecycleManager::now() const
{
    QMutexLocker locker(&m_idleMutex);
    return m_clock();
}

QString ModelLifecycleManager::loadedModelId() const
{
    QMutexLocker locker(&m_loadMutex);
    return m_modelId;
}

std::shared_ptr<SpeechModel> ModelLifecycleManager::acquire(const QString &modelId)
{
    QMutexLocker locker(&m_loadMutex);
    if (m_model && m_modelId == modelId) {
        return m_model;
    }

    SwapGuard guard(m_swapsInProgress);
    const QString path = m_store->ensureModel(modelId);

    if (m_model) {
        qInfo() << "Releasing model" << m_modelId << "to load" << modelId;
        m_model.reset();
        m_modelId.clear();
        m_loaded.store(false);
    }

    std::shared_ptr<SpeechModel> model = m_engine->loadModel(path);
    m_model = model;
    m_modelId = modelId;
    m_loaded.store(true);
    locker.unlock();

    qInfo() << "Model loaded:" << modelId;
    emit modelLoaded(modelId);
    return model;
}

void ModelLifecycleManager::warmUp(const QString &modelId)
{
    // Advisory; acquire() re-checks under the lock.
    if (m_loaded.load() && loadedModelId() == modelId) return;
    acquire(modelId);
}

QString ModelLifecycleManager::prefetch(const QString &modelId)
{
    return m_store->ensureModel(modelId);
}

QString ModelLifecycleManager::transcribe(const QString &modelId, const QVector<float> &samples,
                                          int sampleRate, const TranscribeOptions &options)
{
    std::shared_ptr<SpeechModel> model = acquire(modelId);
    const QString text = model->inferOnBuffer(samples, sampleRate, options);
    markUsed(modelId);
    return text;
}

QString ModelLifecycleManager::transcribeFile(const QString &modelId, const QString &audioPath,
                                              const TranscribeOptions &options)
{
    int sampleRate = 0;
    const QVector<float> samples = WavFile::readAny(audioPath, &sampleRate);
    return transcribe(modelId, samples, sampleRate, options);
}

void ModelLifecycleManager::markUsed(const QString &modelId)
{
    {
        QMutexLocker locker(&m_idleMutex);
        m_lastUsedMs = m_clock();
        m_lastUsedModelId = modelId;
    }
    scheduleIdleCheck();
}

void ModelLifecycleManager::scheduleIdleCheck()
{
    const qint64 threshold = idleThresholdMs();
    QMetaObject::invokeMethod(m_idleTimer, [this, threshold]() {
        m_idleTimer->stop();
        if (threshold > 0) {
            m_idleTimer->start(static_cast<int>(qMin<qint64>(threshold, INT_MAX)));
        }
    });
}

bool ModelLifecycleManager::idleUnload()
{
    qint64 threshold;
    qint64 lastUsed;
    QString lastId;
    QString configuredId;
    ActivityProbe probe;
    {
        QMutexLocker locker(&m_idleMutex);
        threshold = m_idleThresholdMs;
        lastUsed = m_lastUsedMs;
        lastId = m_lastUsedModelId;
        configuredId = m_configuredModelId;
        probe = m_activityProbe;
    }

    if (threshold <= 0) return false;
    if (lastId.isEmpty()) return false;

    if (now() - lastUsed < threshold) {
        scheduleIdleCheck();
        return false;
    }
    const bool busy = (probe && probe()) || isLoading() || m_swapsInProgress.load() > 0;
    if (busy || lastId != configuredId) {
        scheduleIdleCheck();
        return false;
    }

    qInfo() << "Model idle for" << (now() - lastUsed) / 1000 << "s, unloading" << lastId;
    unload();
    return true;
}

void ModelLifecycleManager::unload()
{
    QString releasedId;
    {
        SwapGuard guard(m_swapsInProgress);
        QMutexLocker locker(&m_loadMutex);
        if (!m_model) return;
        releasedId = m_modelId;
        m_model.reset();
        m_modelId.clear();
        m_loaded.store(false);
    }
    qInfo() << "Model unloaded:" << releasedId;
    emit modelUnloaded(releasedId);
}

void ModelLifecycleManager::setLoading(bool loading)
{
    if (m_loading.exchange(loading) != loading) {
        emit loadingChanged(loading);
    }
}

void ModelLifecycleManager::startWarmup(const QString &modelId)
{
    const qint64 total = totalMemoryBytes();
    const bool full = !isLowMemory(total);
    if (!full) {
        qInfo() << "Deferring model warmup due to low RAM (" << total << "bytes).";
    }
    startWarmup(modelId, full);
}

void ModelLifecycleManager::startWarmup(const QString &modelId, bool fullWarmup)
{
    if (modelId.isEmpty()) return;

    const int generation = ++m_warmupGeneration;
    setLoading(true);

    m_background.addFuture(QtConcurrent::run([this, modelId, fullWarmup, generation]() {
        try {
            if (fullWarmup) {
                warmUp(modelId);
                markUsed(modelId);
            } else {
                prefetch(modelId);
            }
        } catch (const std::exception &e) {
            qCritical() << "Model warmup failed:" << e.what();
        }
        // A newer warmup owns the loading flag.
        if (generation == m_warmupGeneration.load()) {
            setLoading(false);
        }
    }));
}

void ModelLifecycleManager::waitForBackgroundTasks()
{
    m_background.waitForFinished();
}
