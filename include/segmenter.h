#ifndef SEGMENTER_H
#define SEGMENTER_H

#include <QVector>
#include <QtGlobal>

struct SegmenterConfig
{
    double frameSeconds = 0.02;
    double minSilenceSeconds = 0.5;
    double minSegmentSeconds = 1.0;
    double maxSegmentSeconds = 0.0;     // 0 = unbounded
    double paddingSeconds = 0.15;
    float rmsThreshold = 0.0f;          // 0 = adaptive noise floor
};

// Half-open sample range [start, end).
struct Segment
{
    qint64 start = 0;
    qint64 end = 0;

    qint64 length() const { return end - start; }
    bool operator==(const Segment &o) const { return start == o.start && end == o.end; }
};

// Energy based splitter. Cuts a mono buffer at the midpoints of long enough
// silence runs, preferring the latest cut that keeps the segment under the
// maximum length.
class Segmenter
{
public:
    explicit Segmenter(const SegmenterConfig &config = SegmenterConfig());

    const SegmenterConfig &config() const { return m_config; }

    // Contiguous cut ranges covering [0, samples.size()) with no padding.
    QVector<Segment> cutRanges(const QVector<float> &samples, int sampleRate) const;

    // cutRanges() widened by the padding on both sides, clamped to the buffer.
    QVector<Segment> split(const QVector<float> &samples, int sampleRate) const;

    static int frameSize(int sampleRate, double frameSeconds);
    static QVector<float> frameEnergies(const QVector<float> &samples, int frameSize);
    // Linear interpolation between closest ranks.
    static float percentile(QVector<float> values, double p);
    static float adaptiveThreshold(const QVector<float> &energies);

private:
    QVector<Segment> silenceRuns(const QVector<float> &samples, int sampleRate) const;

    SegmenterConfig m_config;
};

#endif // SEGMENTER_H
