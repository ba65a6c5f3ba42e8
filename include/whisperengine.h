#ifndef WHISPERENGINE_H
#define WHISPERENGINE_H

#include <QMutex>
#include "speechengine.h"

struct whisper_context;
struct whisper_state;

// whisper.cpp binding. The context holds the weights; each inference call
// runs on its own whisper_state so calls on one model may overlap. One idle
// state is kept for reuse when no prompt carries over, so back-to-back
// segments allocate only once.
class WhisperModel : public SpeechModel
{
public:
    WhisperModel(whisper_context *ctx, const QString &path);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    QString inferOnBuffer(const QVector<float> &samples, int sampleRate,
                          const TranscribeOptions &options) override;

    QString path() const { return m_path; }

    static QVector<float> resampleTo16k(const QVector<float> &input, int inRate);
    // Requested thread count clamped to [1, idealThreadCount].
    static int threadCount(int requested);

private:
    whisper_state *takeState();
    void returnState(whisper_state *state);

    whisper_context *m_ctx = nullptr;
    QString m_path;

    QMutex m_stateMutex;
    whisper_state *m_spareState = nullptr;
};

class WhisperEngine : public SpeechEngine
{
public:
    std::shared_ptr<SpeechModel> loadModel(const QString &modelPath) override;
};

#endif // WHISPERENGINE_H
