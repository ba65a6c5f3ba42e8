#include "recordingcontroller.h"
#include "capturedevice.h"
#include "errors.h"

#include <QDebug>
#include <QFile>

RecordingController::RecordingController(CaptureDevice *capture, QObject *parent)
    : QObject(parent), m_capture(capture)
{
    m_pendingTimer = new QTimer(this);
    m_pendingTimer->setSingleShot(true);
    connect(m_pendingTimer, &QTimer::timeout, this, &RecordingController::commitPendingStop);
}

void RecordingController::setModelLoadingProbe(ModelLoadingProbe probe)
{
    m_modelLoading = std::move(probe);
}

void RecordingController::toggle()
{
    if (m_recording.load()) {
        stopRecording();
        return;
    }
    if (cancelPendingStop()) {
        return;
    }
    if (m_modelLoading && m_modelLoading()) {
        qInfo() << "Model is loading, ignoring hotkey.";
        return;
    }
    startRecording();
}

void RecordingController::startRecording()
{
    QString path;
    try {
        path = m_capture->start();
    } catch (const CaptureError &e) {
        qWarning() << "Failed to start recording:" << e.what();
        emit captureFailed(e.message());
        return;
    }

    m_session = RecordingSession{path, QDateTime::currentDateTime()};
    m_recording.store(true);
    emit recordingStarted(path);
    emit stateChanged();
}

void RecordingController::stopRecording()
{
    m_recording.store(false);
    m_session.reset();

    QString path;
    try {
        path = m_capture->stop();
    } catch (const CaptureError &e) {
        qWarning() << "Failed to stop recording:" << e.what();
        emit captureFailed(e.message());
        emit stateChanged();
        return;
    }

    // Only one pending stop; an older one is dropped with its artifact.
    cancelPendingStop();

    m_pending = PendingStop{path, QDateTime::currentDateTime().addMSecs(kCancelWindowMs)};
    m_pendingTimer->start(kCancelWindowMs);
    emit recordingStopped(path);
    emit stateChanged();
}

bool RecordingController::cancelPendingStop()
{
    if (!m_pending) return false;

    m_pendingTimer->stop();
    const QString path = m_pending->path;
    m_pending.reset();

    if (QFile::exists(path) && !QFile::remove(path)) {
        qWarning() << "Failed to delete canceled recording:" << path;
    }
    qInfo() << "Recording canceled:" << path;
    emit recordingCanceled(path);
    emit stateChanged();
    return true;
}

void RecordingController::commitPendingStop()
{
    if (!m_pending) return;

    const QString path = m_pending->path;
    m_pending.reset();
    qInfo() << "Recording committed:" << path;
    emit stopCommitted(path);
    emit stateChanged();
}
