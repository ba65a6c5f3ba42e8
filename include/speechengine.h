#ifndef SPEECHENGINE_H
#define SPEECHENGINE_H

#include <QString>
#include <QVector>
#include <memory>

struct TranscribeOptions
{
    QString language;                   // empty = auto detect
    bool conditionOnPreviousText = false;
    int threads = 4;
};

// A loaded recognition model. Inference calls may run concurrently; the
// model is released when the last reference goes away.
class SpeechModel
{
public:
    virtual ~SpeechModel() = default;

    // Throws TranscriptionError on inference failure.
    virtual QString inferOnBuffer(const QVector<float> &samples, int sampleRate,
                                  const TranscribeOptions &options) = 0;
};

class SpeechEngine
{
public:
    virtual ~SpeechEngine() = default;

    // Throws ModelUnavailableError when the model file cannot be loaded.
    virtual std::shared_ptr<SpeechModel> loadModel(const QString &modelPath) = 0;
};

#endif // SPEECHENGINE_H
