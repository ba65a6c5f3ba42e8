#include "whisperengine.h"
#include "errors.h"

#include <QDebug>
#include <QFile>
#include <QMutexLocker>
#include <QThread>
#include <cmath>
#include "whisper.h"

namespace {
constexpr int kWhisperRate = WHISPER_SAMPLE_RATE;
}

WhisperModel::WhisperModel(whisper_context *ctx, const QString &path)
    : m_ctx(ctx), m_path(path)
{
}

WhisperModel::~WhisperModel()
{
    if (m_spareState) {
        whisper_free_state(m_spareState);
    }
    if (m_ctx) {
        whisper_free(m_ctx);
        qInfo() << "Whisper model released:" << m_path;
    }
}

QVector<float> WhisperModel::resampleTo16k(const QVector<float> &input, int inRate)
{
    if (input.isEmpty() || inRate <= 0) return {};
    if (inRate == kWhisperRate) return input;

    // Linear interpolation, good enough for speech.
    const double ratio = static_cast<double>(kWhisperRate) / inRate;
    const int outLen = static_cast<int>(std::ceil(input.size() * ratio));
    QVector<float> output(outLen);
    for (int i = 0; i < outLen; ++i) {
        const double src = i / ratio;
        const int i0 = static_cast<int>(src);
        const int i1 = qMin(i0 + 1, static_cast<int>(input.size()) - 1);
        const double frac = src - i0;
        output[i] = static_cast<float>(input[i0] * (1.0 - frac) + input[i1] * frac);
    }
    return output;
}

int WhisperModel::threadCount(int requested)
{
    return qBound(1, requested, qMax(1, QThread::idealThreadCount()));
}

whisper_state *WhisperModel::takeState()
{
    {
        QMutexLocker locker(&m_stateMutex);
        if (m_spareState) {
            whisper_state *state = m_spareState;
            m_spareState = nullptr;
            return state;
        }
    }
    // Overlapping calls each get a fresh state.
    return whisper_init_state(m_ctx);
}

void WhisperModel::returnState(whisper_state *state)
{
    {
        QMutexLocker locker(&m_stateMutex);
        if (!m_spareState) {
            m_spareState = state;
            return;
        }
    }
    whisper_free_state(state);
}

QString WhisperModel::inferOnBuffer(const QVector<float> &samples, int sampleRate,
                                    const TranscribeOptions &options)
{
    const QVector<float> pcm = resampleTo16k(samples, sampleRate);
    if (pcm.isEmpty()) return QString();

    // A reused state would carry the previous call's text as prompt.
    const bool reuse = !options.conditionOnPreviousText;
    whisper_state *state = reuse ? takeState() : whisper_init_state(m_ctx);
    if (!state) {
        throw TranscriptionError("Failed to allocate whisper state.");
    }

    const QByteArray language = options.language.isEmpty() ? QByteArray("auto")
                                                            : options.language.toUtf8();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.translate = false;
    wparams.language = language.constData();
    wparams.no_context = !options.conditionOnPreviousText;
    wparams.n_threads = threadCount(options.threads);
    wparams.offset_ms = 0;

    qDebug() << "Running whisper on" << pcm.size() / double(kWhisperRate) << "seconds of audio";
    if (whisper_full_with_state(m_ctx, state, wparams, pcm.constData(), pcm.size()) != 0) {
        whisper_free_state(state);
        throw TranscriptionError("Whisper failed to process audio.");
    }

    QString fullText;
    const int nSegments = whisper_full_n_segments_from_state(state);
    for (int i = 0; i < nSegments; ++i) {
        const char *text = whisper_full_get_segment_text_from_state(state, i);
        if (text) fullText += QString::fromUtf8(text);
    }
    if (reuse) returnState(state);
    else whisper_free_state(state);
    return fullText.trimmed();
}

std::shared_ptr<SpeechModel> WhisperEngine::loadModel(const QString &modelPath)
{
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        qCritical() << "Model file not found:" << modelPath;
        throw ModelUnavailableError(QString("Model file not found: %1").arg(modelPath));
    }

    qDebug() << "Loading model from:" << modelPath;
    whisper_context_params cparams = whisper_context_default_params();
    whisper_context *ctx = whisper_init_from_file_with_params(modelPath.toStdString().c_str(), cparams);
    if (!ctx) {
        qCritical() << "Failed to initialize whisper context from" << modelPath;
        throw ModelUnavailableError(QString("Failed to load model: %1").arg(modelPath));
    }
    qDebug() << "Whisper initialized successfully";
    return std::make_shared<WhisperModel>(ctx, modelPath);
}
