#ifndef AUDIORECORDER_H
#define AUDIORECORDER_H

#include <QObject>
#include <QAudioSource>
#include <QMediaDevices>
#include <QAudioDevice>
#include <QDateTime>
#include <QIODevice>
#include <QDebug>
#include "capturedevice.h"
#include "wavfile.h"

// Records the default input as 16-bit mono PCM straight into
// <recordsDir>/recording_<YYYYMMDD_HHMMSS>.wav
class AudioRecorder : public QIODevice, public CaptureDevice
{
    Q_OBJECT

public:
    explicit AudioRecorder(const QString &recordsDir, int sampleRate = 16000, QObject *parent = nullptr);
    ~AudioRecorder();

    QString start() override;
    QString stop() override;
    bool isActive() const override { return m_active; }

    QString lastPath() const { return m_lastPath; }
    int sampleRate() const { return m_sampleRate; }

    // Unique within dir: a "_<n>" suffix is added on collision.
    static QString recordingPath(const QString &dir, const QDateTime &time);

protected:
    qint64 readData(char *data, qint64 maxlen) override;
    qint64 writeData(const char *data, qint64 len) override;

private:
    QString m_recordsDir;
    int m_sampleRate;
    QAudioSource *audioSource = nullptr;
    QAudioFormat format;
    QAudioDevice currentDevice;
    WavWriter m_writer;
    QString m_lastPath;
    bool m_active = false;
};

#endif // AUDIORECORDER_H
