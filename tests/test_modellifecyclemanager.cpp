#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSemaphore>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrentRun>
#include <gtest/gtest.h>

#include "errors.h"
#include "fakes.h"
#include "modellifecyclemanager.h"
#include "modelstore.h"
#include "testutil.h"

namespace {
constexpr qint64 kGiB = 1024LL * 1024 * 1024;
}

class ModelLifecycleTest : public ::testing::Test
{
protected:
    ModelLifecycleTest()
        : store(dir.path()),
          manager(&store, &engine)
    {
        manager.setClock([this]() { return clockMs.load(); });
        manager.setConfiguredModelId("base.en");
        seedModel(store, "base.en");
        seedModel(store, "tiny");
    }

    QString infer(const QString &modelId)
    {
        return manager.transcribe(modelId, QVector<float>(1600, 0.1f), 16000, TranscribeOptions());
    }

    std::atomic<qint64> clockMs{1000};
    QTemporaryDir dir;
    ModelStore store;
    FakeSpeechEngine engine;
    ModelLifecycleManager manager;
};

TEST_F(ModelLifecycleTest, LoadsOnceAndReuses)
{
    engine.state->replies = {"first", "second"};

    EXPECT_EQ(infer("base.en"), "first");
    EXPECT_EQ(infer("base.en"), "second");

    EXPECT_EQ(engine.state->loads.load(), 1);
    EXPECT_EQ(engine.state->inferCalls.load(), 2);
    EXPECT_TRUE(manager.isLoaded());
    EXPECT_EQ(manager.loadedModelId(), "base.en");
    EXPECT_EQ(engine.state->loadedPaths, QStringList{store.modelFilePath("base.en")});
}

TEST_F(ModelLifecycleTest, SwitchingModelsReleasesThePreviousOne)
{
    infer("base.en");
    infer("tiny");

    EXPECT_EQ(engine.state->loads.load(), 2);
    EXPECT_EQ(engine.state->released.load(), 1);
    EXPECT_EQ(manager.loadedModelId(), "tiny");
}

TEST_F(ModelLifecycleTest, WarmUpIsANoOpForTheActiveModel)
{
    int loadedSignals = 0;
    QObject::connect(&manager, &ModelLifecycleManager::modelLoaded, [&]() { ++loadedSignals; });

    manager.warmUp("base.en");
    manager.warmUp("base.en");

    EXPECT_EQ(engine.state->loads.load(), 1);
    EXPECT_EQ(loadedSignals, 1);
    EXPECT_EQ(engine.state->inferCalls.load(), 0);
}

TEST_F(ModelLifecycleTest, IdleUnloadWaitsForTheThreshold)
{
    manager.setIdleThresholdMs(60000);
    QStringList unloaded;
    QObject::connect(&manager, &ModelLifecycleManager::modelUnloaded,
                     [&](const QString &id) { unloaded << id; });

    infer("base.en");

    clockMs += 30000;
    EXPECT_FALSE(manager.idleUnload());
    EXPECT_TRUE(manager.isLoaded());

    clockMs += 30000;
    EXPECT_TRUE(manager.idleUnload());
    EXPECT_FALSE(manager.isLoaded());
    EXPECT_TRUE(manager.loadedModelId().isEmpty());
    EXPECT_EQ(engine.state->released.load(), 1);
    EXPECT_EQ(unloaded, QStringList{"base.en"});

    // Next use loads again.
    infer("base.en");
    EXPECT_EQ(engine.state->loads.load(), 2);
}

TEST_F(ModelLifecycleTest, IdleUnloadSkipsWhileBusy)
{
    manager.setIdleThresholdMs(1000);
    bool busy = true;
    manager.setActivityProbe([&]() { return busy; });

    infer("base.en");
    clockMs += 5000;
    EXPECT_FALSE(manager.idleUnload());
    EXPECT_TRUE(manager.isLoaded());

    busy = false;
    EXPECT_TRUE(manager.idleUnload());
}

TEST_F(ModelLifecycleTest, IdleUnloadOnlyForTheConfiguredModel)
{
    manager.setIdleThresholdMs(1000);

    infer("tiny");
    clockMs += 5000;
    EXPECT_FALSE(manager.idleUnload());
    EXPECT_TRUE(manager.isLoaded());

    manager.setConfiguredModelId("tiny");
    EXPECT_TRUE(manager.idleUnload());
}

TEST_F(ModelLifecycleTest, ZeroThresholdNeverUnloads)
{
    manager.setIdleThresholdMs(0);
    infer("base.en");
    clockMs += 24LL * 3600 * 1000;

    EXPECT_FALSE(manager.idleUnload());
    EXPECT_TRUE(manager.isLoaded());
}

TEST_F(ModelLifecycleTest, NothingToUnloadBeforeFirstUse)
{
    manager.setIdleThresholdMs(1000);
    clockMs += 5000;
    EXPECT_FALSE(manager.idleUnload());
}

TEST_F(ModelLifecycleTest, UnloadDuringInferenceWaitsForIt)
{
    QSemaphore gate;
    engine.state->inferGate = &gate;
    engine.state->replies = {"kept"};

    QFuture<QString> pending = QtConcurrent::run([this]() { return infer("base.en"); });
    ASSERT_TRUE(waitUntil([&]() { return engine.state->inferCalls.load() == 1; }));

    manager.unload();
    EXPECT_FALSE(manager.isLoaded());
    // The running call still holds the model.
    EXPECT_EQ(engine.state->released.load(), 0);

    gate.release();
    pending.waitForFinished();
    EXPECT_EQ(pending.result(), "kept");
    EXPECT_EQ(engine.state->released.load(), 1);
    engine.state->inferGate = nullptr;
}

TEST_F(ModelLifecycleTest, FailedLoadIsRetriedOnNextUse)
{
    engine.state->failNextLoads = 1;

    EXPECT_THROW(infer("base.en"), ModelUnavailableError);
    EXPECT_FALSE(manager.isLoaded());

    engine.state->replies = {"ok"};
    EXPECT_EQ(infer("base.en"), "ok");
    EXPECT_TRUE(manager.isLoaded());
}

TEST_F(ModelLifecycleTest, InferenceErrorsPropagate)
{
    engine.state->failInference = true;
    EXPECT_THROW(infer("base.en"), TranscriptionError);
    // The model stays loaded for the next attempt.
    EXPECT_TRUE(manager.isLoaded());
}

TEST_F(ModelLifecycleTest, DownloadFailureIsModelUnavailable)
{
    FakeHttpServer server;
    server.respondWith(404, "Entry not found");
    store.setDownloadBase(server.baseUrl());

    EXPECT_THROW(manager.warmUp("small.en"), ModelUnavailableError);
    EXPECT_EQ(server.requestCount(), 1);
    EXPECT_EQ(server.lastRequest().path, "/ggerganov/whisper.cpp/resolve/main/ggml-small.en.bin");
    EXPECT_EQ(engine.state->loads.load(), 0);
    EXPECT_FALSE(QFile::exists(store.modelFilePath("small.en") + ".part"));
    EXPECT_FALSE(store.isDownloaded("small.en"));
}

TEST_F(ModelLifecycleTest, BackgroundWarmupRaisesTheLoadingFlag)
{
    QSemaphore gate;
    engine.state->loadGate = &gate;
    QList<bool> transitions;
    QMutex transitionsLock;
    QObject::connect(&manager, &ModelLifecycleManager::loadingChanged, [&](bool loading) {
        QMutexLocker locker(&transitionsLock);
        transitions << loading;
    });

    manager.startWarmup("base.en", true);
    EXPECT_TRUE(manager.isLoading());
    EXPECT_FALSE(manager.isLoaded());

    gate.release();
    manager.waitForBackgroundTasks();
    engine.state->loadGate = nullptr;

    EXPECT_FALSE(manager.isLoading());
    EXPECT_TRUE(manager.isLoaded());
    QMutexLocker locker(&transitionsLock);
    EXPECT_EQ(transitions, (QList<bool>{true, false}));
}

TEST_F(ModelLifecycleTest, SelectingAModelWarmsItUp)
{
    QList<bool> transitions;
    QMutex transitionsLock;
    QObject::connect(&manager, &ModelLifecycleManager::loadingChanged, [&](bool loading) {
        QMutexLocker locker(&transitionsLock);
        transitions << loading;
    });

    EXPECT_TRUE(manager.selectModel("tiny"));
    EXPECT_EQ(manager.configuredModelId(), "tiny");
    manager.waitForBackgroundTasks();

    {
        QMutexLocker locker(&transitionsLock);
        EXPECT_EQ(transitions, (QList<bool>{true, false}));
    }
    // Low memory machines only prefetch; the load waits for first use.
    const bool full = !ModelLifecycleManager::isLowMemory(ModelLifecycleManager::totalMemoryBytes());
    EXPECT_EQ(manager.isLoaded(), full);
    if (full) {
        EXPECT_EQ(manager.loadedModelId(), "tiny");
    }

    EXPECT_FALSE(manager.selectModel("tiny"));
    manager.waitForBackgroundTasks();
    QMutexLocker locker(&transitionsLock);
    EXPECT_EQ(transitions.size(), 2);
}

TEST_F(ModelLifecycleTest, PrefetchOnlyWarmupDoesNotLoad)
{
    manager.startWarmup("base.en", false);
    manager.waitForBackgroundTasks();

    EXPECT_FALSE(manager.isLoading());
    EXPECT_FALSE(manager.isLoaded());
    EXPECT_EQ(engine.state->loads.load(), 0);
}

TEST_F(ModelLifecycleTest, FailedWarmupClearsTheLoadingFlag)
{
    engine.state->failNextLoads = 1;
    manager.startWarmup("base.en", true);
    manager.waitForBackgroundTasks();

    EXPECT_FALSE(manager.isLoading());
    EXPECT_FALSE(manager.isLoaded());
}

TEST_F(ModelLifecycleTest, IdleTimerUnloadsOnItsOwn)
{
    QElapsedTimer monotonic;
    monotonic.start();
    manager.setClock([monotonic]() { return monotonic.elapsed(); });
    manager.setIdleThresholdMs(50);

    infer("base.en");
    ASSERT_TRUE(manager.isLoaded());
    EXPECT_TRUE(waitUntil([&]() { return !manager.isLoaded(); }, 2000));
}

TEST(ModelLifecyclePolicy, IdleDefaultsFollowInstalledMemory)
{
    EXPECT_TRUE(ModelLifecycleManager::isLowMemory(8 * kGiB));
    EXPECT_FALSE(ModelLifecycleManager::isLowMemory(16 * kGiB));
    EXPECT_FALSE(ModelLifecycleManager::isLowMemory(0));

    EXPECT_EQ(ModelLifecycleManager::defaultIdleMinutes(8 * kGiB), 15);
    EXPECT_EQ(ModelLifecycleManager::defaultIdleMinutes(32 * kGiB), 0);
    EXPECT_EQ(ModelLifecycleManager::defaultIdleMinutes(0), 0);
}

TEST(ModelLifecyclePolicy, IdleMinutesSetting)
{
    QTemporaryDir dir;
    ModelStore store(dir.path());
    FakeSpeechEngine engine;
    ModelLifecycleManager manager(&store, &engine);

    manager.setIdleMinutes(5);
    EXPECT_EQ(manager.idleThresholdMs(), 300000);
    manager.setIdleMinutes(0);
    EXPECT_EQ(manager.idleThresholdMs(), 0);
    manager.setIdleMinutes(-3);
    EXPECT_EQ(manager.idleThresholdMs(), 0);

    manager.setIdleMinutes(std::nullopt);
    const int expected = ModelLifecycleManager::defaultIdleMinutes(ModelLifecycleManager::totalMemoryBytes());
    EXPECT_EQ(manager.idleThresholdMs(), qint64(expected) * 60 * 1000);
}
