#include "audiorecorder.h"
#include "errors.h"

#include <QDir>
#include <QFile>

AudioRecorder::AudioRecorder(const QString &recordsDir, int sampleRate, QObject *parent)
    : QIODevice(parent), m_recordsDir(recordsDir), m_sampleRate(sampleRate)
{
    format.setSampleRate(m_sampleRate);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    currentDevice = QMediaDevices::defaultAudioInput();
    if (currentDevice.isNull()) {
        qWarning() << "No default audio input device found!";
        return;
    }
    if (!currentDevice.isFormatSupported(format)) {
        qWarning() << "Requested format not supported - system may adapt.";
    }

    audioSource = new QAudioSource(currentDevice, format, this);
}

AudioRecorder::~AudioRecorder()
{
    stop();
}

QString AudioRecorder::recordingPath(const QString &dir, const QDateTime &time)
{
    const QString stem = "recording_" + time.toString("yyyyMMdd_HHmmss");
    const QDir target(dir);
    QString path = target.filePath(stem + ".wav");
    for (int n = 1; QFile::exists(path); ++n) {
        path = target.filePath(QString("%1_%2.wav").arg(stem).arg(n));
    }
    return path;
}

QString AudioRecorder::start()
{
    if (m_active) {
        throw CaptureError("Recording already active.");
    }
    if (!audioSource) {
        throw CaptureError("No audio input device available.");
    }
    if (!QDir().mkpath(m_recordsDir)) {
        throw CaptureError(QString("Cannot create recordings directory %1").arg(m_recordsDir));
    }

    const QString path = recordingPath(m_recordsDir, QDateTime::currentDateTime());
    if (!m_writer.open(path, m_sampleRate, 1)) {
        throw CaptureError(QString("Cannot open %1: %2").arg(path, m_writer.errorString()));
    }

    if (!open(QIODevice::WriteOnly)) {
        m_writer.finalize();
        QFile::remove(path);
        throw CaptureError(QString("Cannot open the capture sink: %1").arg(errorString()));
    }
    audioSource->start(this);
    if (audioSource->error() != QAudio::NoError) {
        const int code = audioSource->error();
        audioSource->stop();
        close();
        m_writer.finalize();
        QFile::remove(path);
        throw CaptureError(QString("Audio device rejected the recording (error %1).").arg(code));
    }

    m_active = true;
    m_lastPath = path;
    qInfo() << "Recording started:" << path;
    return path;
}

QString AudioRecorder::stop()
{
    if (!m_active) return m_lastPath;

    if (audioSource) audioSource->stop();
    close();
    if (!m_writer.finalize()) {
        qWarning() << "Failed to finalize" << m_lastPath;
    }
    m_active = false;
    qInfo() << "Recording stopped:" << m_lastPath;
    return m_lastPath;
}

// QAudioSource calls this to push captured PCM into the file
qint64 AudioRecorder::writeData(const char *data, qint64 len)
{
    if (!m_writer.append(data, len)) {
        qWarning() << "Short write to" << m_lastPath;
    }
    return len;
}

qint64 AudioRecorder::readData(char *data, qint64 maxlen)
{
    Q_UNUSED(data);
    Q_UNUSED(maxlen);
    return 0; // We don't read from here
}
