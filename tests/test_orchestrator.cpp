#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSemaphore>
#include <QTemporaryDir>
#include <gtest/gtest.h>

#include "errors.h"
#include "fakes.h"
#include "modellifecyclemanager.h"
#include "modelstore.h"
#include "postprocessclient.h"
#include "testutil.h"
#include "transcriptionorchestrator.h"
#include "wavfile.h"

namespace {

QJsonObject readJson(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QJsonObject();
    return QJsonDocument::fromJson(file.readAll()).object();
}

QByteArray chatReply(const QString &content)
{
    QJsonObject message{{"role", "assistant"}, {"content", content}};
    return QJsonDocument(QJsonObject{{"choices", QJsonArray{QJsonObject{{"message", message}}}}})
        .toJson(QJsonDocument::Compact);
}

}

class OrchestratorTest : public ::testing::Test
{
protected:
    OrchestratorTest()
        : store(QDir(dir.path()).filePath("models")),
          models(&store, &engine),
          postprocess([this]() { return apiKey; }),
          orchestrator(&models, &postprocess)
    {
        seedModel(store, "base.en");
        QDir().mkpath(recordsDir());
    }

    QString recordsDir() const { return QDir(dir.path()).filePath("records"); }

    // 1.2 s tone, 600 ms silence, 1.2 s tone.
    QString writeTwoPhrases(const QString &name, int channels = 1)
    {
        const QVector<qint16> mono = toPcm16(toneBuffer(16000, 3.0, {{0.0, 1.2}, {1.8, 3.0}}));
        QVector<qint16> samples;
        for (qint16 s : mono) {
            for (int c = 0; c < channels; ++c) samples << s;
        }
        const QString path = QDir(recordsDir()).filePath(name + ".wav");
        WavFile::write(path, samples, 16000, channels);
        return path;
    }

    QTemporaryDir dir;
    QString apiKey = "sk-test";
    ModelStore store;
    FakeSpeechEngine engine;
    ModelLifecycleManager models;
    PostprocessClient postprocess;
    TranscriptionOrchestrator orchestrator;
};

TEST_F(OrchestratorTest, SegmentsAreTranscribedAndJoined)
{
    engine.state->replies = {"hello", "  world "};
    const QString audio = writeTwoPhrases("recording_20240101_090000");

    const TranscriptRecord record = orchestrator.run(audio, "base.en");

    EXPECT_EQ(record.id, "recording_20240101_090000");
    EXPECT_EQ(record.text, "hello world");
    EXPECT_EQ(record.originalText, "hello world");
    EXPECT_TRUE(record.polishedText.isEmpty());
    EXPECT_EQ(engine.state->inferCalls.load(), 2);
    EXPECT_EQ(engine.state->sampleCounts, (QList<int>{26400, 26400}));
    EXPECT_EQ(orchestrator.inFlight(), 0);

    EXPECT_EQ(record.jsonPath, QDir(recordsDir()).filePath("recording_20240101_090000.json"));
    const QJsonObject json = readJson(record.jsonPath);
    EXPECT_EQ(json.value("id").toString(), "recording_20240101_090000");
    EXPECT_EQ(json.value("text").toString(), "hello world");
    EXPECT_EQ(json.value("original_text").toString(), "hello world");
    EXPECT_EQ(json.value("polished_text").toString(), "");
}

TEST_F(OrchestratorTest, BlankSegmentsAreDropped)
{
    engine.state->replies = {"   ", "world"};
    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("blank"), "base.en");
    EXPECT_EQ(record.text, "world");
}

TEST_F(OrchestratorTest, SegmentationOffMeansOneCall)
{
    TranscriptionSettings settings;
    settings.segmentOnSilence = false;
    orchestrator.setSettings(settings);
    engine.state->replies = {"all of it"};

    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("whole"), "base.en");
    EXPECT_EQ(record.text, "all of it");
    EXPECT_EQ(engine.state->sampleCounts, QList<int>{48000});
}

TEST_F(OrchestratorTest, StereoFilesSkipSegmentation)
{
    engine.state->replies = {"stereo"};
    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("stereo", 2), "base.en");
    EXPECT_EQ(record.text, "stereo");
    EXPECT_EQ(engine.state->sampleCounts, QList<int>{48000});
}

TEST_F(OrchestratorTest, PostprocessFailureKeepsTheRawText)
{
    PostprocessConfig config;
    config.enabled = true;
    orchestrator.setPostprocessConfig(config);
    apiKey.clear();
    engine.state->replies = {"hello", "world"};

    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("fallback"), "base.en");
    EXPECT_EQ(record.text, "hello world");
    EXPECT_EQ(record.originalText, "hello world");
    EXPECT_TRUE(record.polishedText.isEmpty());
}

TEST_F(OrchestratorTest, PostprocessedTextIsDelivered)
{
    FakeHttpServer server;
    server.respondWith(200, chatReply("<transcript>Hello, world.</transcript>"));
    PostprocessConfig config;
    config.enabled = true;
    config.baseUrl = server.baseUrl();
    config.timeoutMs = 5000;
    orchestrator.setPostprocessConfig(config);
    engine.state->replies = {"hello", "world"};

    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("polished"), "base.en");
    EXPECT_EQ(record.text, "Hello, world.");
    EXPECT_EQ(record.originalText, "hello world");
    EXPECT_EQ(record.polishedText, "Hello, world.");
    EXPECT_EQ(server.requestCount(), 1);

    const QJsonObject json = readJson(record.jsonPath);
    EXPECT_EQ(json.value("text").toString(), "Hello, world.");
    EXPECT_EQ(json.value("original_text").toString(), "hello world");
    EXPECT_EQ(json.value("polished_text").toString(), "Hello, world.");
}

TEST_F(OrchestratorTest, EmptyTranscriptSkipsPostprocessing)
{
    FakeHttpServer server;
    PostprocessConfig config;
    config.enabled = true;
    config.baseUrl = server.baseUrl();
    orchestrator.setPostprocessConfig(config);

    const TranscriptRecord record = orchestrator.run(writeTwoPhrases("quiet"), "base.en");
    EXPECT_TRUE(record.text.isEmpty());
    EXPECT_EQ(server.requestCount(), 0);
    EXPECT_TRUE(QFile::exists(record.jsonPath));
}

TEST_F(OrchestratorTest, InferenceFailurePropagates)
{
    engine.state->failInference = true;
    const QString audio = writeTwoPhrases("broken");

    EXPECT_THROW(orchestrator.run(audio, "base.en"), TranscriptionError);
    EXPECT_EQ(orchestrator.inFlight(), 0);
    EXPECT_FALSE(QFile::exists(QDir(recordsDir()).filePath("broken.json")));
}

TEST_F(OrchestratorTest, RunAsyncReportsTheRecord)
{
    QSemaphore gate;
    engine.state->inferGate = &gate;
    engine.state->replies = {"one", "two"};

    QObject receiver;
    QList<TranscriptRecord> ready;
    QObject::connect(&orchestrator, &TranscriptionOrchestrator::transcriptReady, &receiver,
                     [&](const TranscriptRecord &r) { ready << r; });

    orchestrator.runAsync(writeTwoPhrases("async"), "base.en");
    EXPECT_TRUE(orchestrator.isTranscribing());
    EXPECT_EQ(orchestrator.inFlight(), 1);

    gate.release(2);
    ASSERT_TRUE(waitUntil([&]() { return !ready.isEmpty(); }));
    orchestrator.waitForIdle();
    engine.state->inferGate = nullptr;

    EXPECT_EQ(ready.first().text, "one two");
    EXPECT_EQ(orchestrator.inFlight(), 0);
}

TEST_F(OrchestratorTest, RunAsyncReportsFailures)
{
    QObject receiver;
    QStringList failed;
    QObject::connect(&orchestrator, &TranscriptionOrchestrator::transcriptionFailed, &receiver,
                     [&](const QString &path, const QString &) { failed << path; });

    const QString missing = QDir(recordsDir()).filePath("missing.wav");
    orchestrator.runAsync(missing, "base.en");
    ASSERT_TRUE(waitUntil([&]() { return !failed.isEmpty(); }));
    orchestrator.waitForIdle();

    EXPECT_EQ(failed, QStringList{missing});
    EXPECT_EQ(orchestrator.inFlight(), 0);
}

TEST(TranscriptJson, UnwritableDirectoryThrows)
{
    TranscriptRecord record;
    EXPECT_THROW(TranscriptionOrchestrator::writeTranscriptJson("/nonexistent/dir/a.wav", record),
                 TranscriptionError);
}
