#include "wavfile.h"
#include "errors.h"

#include <QDebug>
#include <QtEndian>
#include <cstring>

namespace {

constexpr quint16 kFormatPcm = 1;
constexpr quint16 kFormatFloat = 3;
constexpr quint16 kFormatExtensible = 0xFFFE;

struct ParsedWav
{
    WavFormat format;
    QByteArray payload;
};

template <typename T>
T readLe(const char *p)
{
    return qFromLittleEndian<T>(reinterpret_cast<const uchar*>(p));
}

std::optional<ParsedWav> parse(const QByteArray &bytes)
{
    if (bytes.size() < 12) return std::nullopt;
    const char *base = bytes.constData();
    if (std::memcmp(base, "RIFF", 4) != 0 || std::memcmp(base + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    ParsedWav out;
    bool haveFormat = false;
    bool haveData = false;
    qint64 pos = 12;

    while (pos + 8 <= bytes.size()) {
        const char *chunk = base + pos;
        const quint32 declared = readLe<quint32>(chunk + 4);
        const qint64 available = bytes.size() - (pos + 8);
        const qint64 size = qMin<qint64>(declared, available);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) return std::nullopt;
            quint16 tag = readLe<quint16>(chunk + 8);
            out.format.channels = readLe<quint16>(chunk + 10);
            out.format.sampleRate = static_cast<int>(readLe<quint32>(chunk + 12));
            out.format.bitsPerSample = readLe<quint16>(chunk + 22);
            if (tag == kFormatExtensible && size >= 26) {
                tag = readLe<quint16>(chunk + 32);
            }
            if (tag != kFormatPcm && tag != kFormatFloat) return std::nullopt;
            out.format.isFloat = (tag == kFormatFloat);
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            // Unfinalized streams declare 0 or 0xFFFFFFFF; take what is there.
            const qint64 dataSize = (declared == 0 || declared == 0xFFFFFFFFu) ? available : size;
            out.payload = bytes.mid(pos + 8, dataSize);
            haveData = true;
            break;
        }
        pos += 8 + size + (size & 1);
    }

    if (!haveFormat || !haveData) return std::nullopt;
    if (out.format.channels <= 0 || out.format.sampleRate <= 0) return std::nullopt;
    return out;
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return {};
    return file.readAll();
}

}

WavWriter::~WavWriter()
{
    if (m_file.isOpen()) finalize();
}

bool WavWriter::open(const QString &path, int sampleRate, int channels)
{
    if (m_file.isOpen()) finalize();

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Cannot open" << path << "for writing:" << m_file.errorString();
        return false;
    }
    m_sampleRate = sampleRate;
    m_channels = channels;
    m_dataBytes = 0;
    writeHeader(0);
    return m_file.error() == QFileDevice::NoError;
}

bool WavWriter::append(const char *data, qint64 len)
{
    if (!m_file.isOpen() || len <= 0) return false;
    const qint64 written = m_file.write(data, len);
    if (written > 0) m_dataBytes += written;
    return written == len;
}

bool WavWriter::finalize()
{
    if (!m_file.isOpen()) return false;

    // Keep whole sample frames only.
    const qint64 frameBytes = 2 * m_channels;
    const qint64 usable = m_dataBytes - (m_dataBytes % frameBytes);
    if (usable != m_dataBytes) {
        m_file.resize(44 + usable);
        m_dataBytes = usable;
    }

    m_file.seek(0);
    writeHeader(static_cast<quint32>(m_dataBytes));
    const bool ok = m_file.flush();
    m_file.close();
    return ok;
}

void WavWriter::writeHeader(quint32 dataBytes)
{
    const quint16 channels = static_cast<quint16>(m_channels);
    const quint16 bits = 16;
    const quint16 blockAlign = channels * bits / 8;
    const quint32 byteRate = static_cast<quint32>(m_sampleRate) * blockAlign;

    char header[44];
    std::memcpy(header, "RIFF", 4);
    qToLittleEndian<quint32>(36 + dataBytes, header + 4);
    std::memcpy(header + 8, "WAVE", 4);
    std::memcpy(header + 12, "fmt ", 4);
    qToLittleEndian<quint32>(16, header + 16);
    qToLittleEndian<quint16>(kFormatPcm, header + 20);
    qToLittleEndian<quint16>(channels, header + 22);
    qToLittleEndian<quint32>(static_cast<quint32>(m_sampleRate), header + 24);
    qToLittleEndian<quint32>(byteRate, header + 28);
    qToLittleEndian<quint16>(blockAlign, header + 32);
    qToLittleEndian<quint16>(bits, header + 34);
    std::memcpy(header + 36, "data", 4);
    qToLittleEndian<quint32>(dataBytes, header + 40);
    m_file.write(header, sizeof(header));
}

bool WavFile::write(const QString &path, const QVector<qint16> &samples, int sampleRate, int channels)
{
    WavWriter writer;
    if (!writer.open(path, sampleRate, channels)) return false;

    QByteArray pcm(samples.size() * 2, Qt::Uninitialized);
    for (int i = 0; i < samples.size(); ++i) {
        qToLittleEndian<qint16>(samples[i], pcm.data() + 2 * i);
    }
    if (!pcm.isEmpty() && !writer.append(pcm.constData(), pcm.size())) return false;
    return writer.finalize();
}

std::optional<WavFormat> WavFile::probe(const QString &path)
{
    const auto parsed = parse(readFile(path));
    if (!parsed) return std::nullopt;
    return parsed->format;
}

std::optional<QVector<float>> WavFile::readMono16(const QString &path, int expectedRate)
{
    const auto parsed = parse(readFile(path));
    if (!parsed) return std::nullopt;

    const WavFormat &fmt = parsed->format;
    if (fmt.channels != 1 || fmt.bitsPerSample != 16 || fmt.isFloat || fmt.sampleRate != expectedRate) {
        return std::nullopt;
    }

    const int count = parsed->payload.size() / 2;
    if (count == 0) return std::nullopt;

    QVector<float> out(count);
    const char *p = parsed->payload.constData();
    for (int i = 0; i < count; ++i) {
        out[i] = static_cast<float>(readLe<qint16>(p + 2 * i)) / 32768.0f;
    }
    return out;
}

QVector<float> WavFile::readAny(const QString &path, int *sampleRate)
{
    const auto parsed = parse(readFile(path));
    if (!parsed) {
        throw TranscriptionError(QString("Unsupported or unreadable audio file: %1").arg(path));
    }

    const WavFormat &fmt = parsed->format;
    const int bytesPerSample = fmt.bitsPerSample / 8;
    const bool supported = fmt.isFloat ? fmt.bitsPerSample == 32
                                       : (bytesPerSample >= 1 && bytesPerSample <= 4);
    if (!supported) {
        throw TranscriptionError(QString("Unsupported sample width %1 bits in %2")
                                     .arg(fmt.bitsPerSample).arg(path));
    }

    const int frameBytes = bytesPerSample * fmt.channels;
    const int frames = parsed->payload.size() / frameBytes;
    const char *p = parsed->payload.constData();

    QVector<float> out(frames, 0.0f);
    for (int f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int c = 0; c < fmt.channels; ++c) {
            const char *s = p + f * frameBytes + c * bytesPerSample;
            float v = 0.0f;
            if (fmt.isFloat) {
                v = qFromLittleEndian<float>(reinterpret_cast<const uchar*>(s));
            } else if (bytesPerSample == 1) {
                v = (static_cast<int>(static_cast<quint8>(*s)) - 128) / 128.0f;
            } else if (bytesPerSample == 2) {
                v = readLe<qint16>(s) / 32768.0f;
            } else if (bytesPerSample == 3) {
                qint32 x = static_cast<quint8>(s[0]) | (static_cast<quint8>(s[1]) << 8)
                         | (static_cast<qint8>(s[2]) * 65536);
                v = x / 8388608.0f;
            } else {
                v = static_cast<float>(readLe<qint32>(s) / 2147483648.0);
            }
            sum += v;
        }
        out[f] = sum / fmt.channels;
    }

    if (sampleRate) *sampleRate = fmt.sampleRate;
    return out;
}
