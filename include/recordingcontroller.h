#ifndef RECORDINGCONTROLLER_H
#define RECORDINGCONTROLLER_H

#include <QObject>
#include <QDateTime>
#include <QString>
#include <QTimer>
#include <atomic>
#include <functional>
#include <optional>

class CaptureDevice;

// Hotkey toggle state machine. A stop is held back for a short cancel window;
// toggling again inside it throws the recording away instead of transcribing.
class RecordingController : public QObject
{
    Q_OBJECT
public:
    enum class State { Idle, Recording };

    static constexpr int kCancelWindowMs = 400;

    using ModelLoadingProbe = std::function<bool()>;

    explicit RecordingController(CaptureDevice *capture, QObject *parent = nullptr);

    void setModelLoadingProbe(ModelLoadingProbe probe);

    State state() const { return m_recording.load() ? State::Recording : State::Idle; }
    bool isRecording() const { return m_recording.load(); }
    bool hasPendingStop() const { return m_pending.has_value(); }
    QString pendingStopPath() const { return m_pending ? m_pending->path : QString(); }
    QString sessionPath() const { return m_session ? m_session->path : QString(); }

public slots:
    void toggle();

signals:
    void recordingStarted(const QString &path);
    void recordingStopped(const QString &path);
    void recordingCanceled(const QString &path);
    // The cancel window ran out; path is ready for transcription.
    void stopCommitted(const QString &path);
    void captureFailed(const QString &error);
    void stateChanged();

private:
    struct RecordingSession
    {
        QString path;
        QDateTime startTime;
    };

    struct PendingStop
    {
        QString path;
        QDateTime deadline;
    };

    void startRecording();
    void stopRecording();
    bool cancelPendingStop();
    void commitPendingStop();

    CaptureDevice *m_capture;
    ModelLoadingProbe m_modelLoading;

    std::atomic<bool> m_recording{false};
    std::optional<RecordingSession> m_session;
    std::optional<PendingStop> m_pending;
    QTimer *m_pendingTimer;
};

#endif // RECORDINGCONTROLLER_H
