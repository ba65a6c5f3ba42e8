#ifndef WAVFILE_H
#define WAVFILE_H

#include <QFile>
#include <QString>
#include <QVector>
#include <optional>

struct WavFormat
{
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;
    bool isFloat = false;
};

// Streams 16-bit little-endian PCM into a RIFF/WAVE file. The header sizes
// are patched when the writer is finalized.
class WavWriter
{
public:
    WavWriter() = default;
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const QString &path, int sampleRate, int channels = 1);
    bool append(const char *data, qint64 len);
    bool finalize();

    bool isOpen() const { return m_file.isOpen(); }
    qint64 dataBytes() const { return m_dataBytes; }
    QString errorString() const { return m_file.errorString(); }

private:
    void writeHeader(quint32 dataBytes);

    QFile m_file;
    int m_sampleRate = 0;
    int m_channels = 1;
    qint64 m_dataBytes = 0;
};

class WavFile
{
public:
    static bool write(const QString &path, const QVector<qint16> &samples, int sampleRate, int channels = 1);

    static std::optional<WavFormat> probe(const QString &path);

    // Samples scaled to [-1, 1), only for mono 16-bit files at exactly
    // expectedRate. Anything else (or an empty/unreadable file) yields nullopt.
    static std::optional<QVector<float>> readMono16(const QString &path, int expectedRate);

    // Decodes any PCM/float WAV and downmixes it to mono.
    // Throws TranscriptionError if the file cannot be decoded.
    static QVector<float> readAny(const QString &path, int *sampleRate);
};

#endif // WAVFILE_H
