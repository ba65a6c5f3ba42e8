#include "segmenter.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace {
constexpr float kNoiseFloorFactor = 2.5f;
constexpr float kMinThreshold = 0.003f;
}

Segmenter::Segmenter(const SegmenterConfig &config) : m_config(config)
{
}

int Segmenter::frameSize(int sampleRate, double frameSeconds)
{
    return std::max(1, static_cast<int>(sampleRate * frameSeconds));
}

QVector<float> Segmenter::frameEnergies(const QVector<float> &samples, int frameSize)
{
    QVector<float> energies;
    energies.reserve(samples.size() / frameSize + 1);

    for (int idx = 0; idx < samples.size(); idx += frameSize) {
        const int end = std::min(idx + frameSize, static_cast<int>(samples.size()));
        double sum = 0.0;
        for (int i = idx; i < end; ++i) {
            sum += static_cast<double>(samples[i]) * samples[i];
        }
        energies.append(static_cast<float>(std::sqrt(sum / (end - idx))));
    }
    return energies;
}

float Segmenter::percentile(QVector<float> values, double p)
{
    if (values.isEmpty()) return 0.0f;
    std::sort(values.begin(), values.end());

    const double rank = (p / 100.0) * (values.size() - 1);
    const int lo = static_cast<int>(std::floor(rank));
    const int hi = std::min(lo + 1, static_cast<int>(values.size()) - 1);
    const double frac = rank - lo;
    return static_cast<float>(values[lo] + (values[hi] - values[lo]) * frac);
}

float Segmenter::adaptiveThreshold(const QVector<float> &energies)
{
    return std::max(percentile(energies, 10.0) * kNoiseFloorFactor, kMinThreshold);
}

QVector<Segment> Segmenter::silenceRuns(const QVector<float> &samples, int sampleRate) const
{
    const int fs = frameSize(sampleRate, m_config.frameSeconds);
    const QVector<float> energies = frameEnergies(samples, fs);
    const float threshold = m_config.rmsThreshold > 0.0f ? m_config.rmsThreshold
                                                         : adaptiveThreshold(energies);
    const int minSilenceFrames = std::max(1, static_cast<int>(m_config.minSilenceSeconds * sampleRate / fs));
    const qint64 len = samples.size();

    QVector<Segment> runs;
    int runStart = -1;
    auto closeRun = [&](int endFrame) {
        if (endFrame - runStart >= minSilenceFrames) {
            runs.append({static_cast<qint64>(runStart) * fs,
                         std::min(static_cast<qint64>(endFrame) * fs, len)});
        }
        runStart = -1;
    };

    for (int idx = 0; idx < energies.size(); ++idx) {
        const bool silent = energies[idx] < threshold;
        if (silent && runStart < 0) {
            runStart = idx;
        } else if (!silent && runStart >= 0) {
            closeRun(idx);
        }
    }
    if (runStart >= 0) closeRun(energies.size());

    qDebug() << "Segmenter: threshold" << threshold << "silence runs" << runs.size();
    return runs;
}

QVector<Segment> Segmenter::cutRanges(const QVector<float> &samples, int sampleRate) const
{
    QVector<Segment> ranges;
    const qint64 len = samples.size();
    if (len == 0 || sampleRate <= 0) return ranges;

    const QVector<Segment> silences = silenceRuns(samples, sampleRate);
    const qint64 minSeg = std::max<qint64>(1, static_cast<qint64>(m_config.minSegmentSeconds * sampleRate));
    const qint64 maxSeg = m_config.maxSegmentSeconds > 0
        ? std::max(minSeg, static_cast<qint64>(m_config.maxSegmentSeconds * sampleRate))
        : len;

    qint64 start = 0;
    while (start < len) {
        const qint64 targetEnd = std::min(start + maxSeg, len);
        qint64 cut = -1;
        for (const Segment &run : silences) {
            const qint64 mid = (run.start + run.end) / 2;
            if (mid <= start + minSeg) continue;
            if (mid > targetEnd) break;
            cut = mid;     // latest qualifying midpoint wins
        }

        qint64 end = cut >= 0 ? cut : targetEnd;
        if (end <= start) {
            end = std::min(start + maxSeg, len);
            if (end <= start) break;
        }
        ranges.append({start, end});
        start = end;
    }
    return ranges;
}

QVector<Segment> Segmenter::split(const QVector<float> &samples, int sampleRate) const
{
    const qint64 len = samples.size();
    const qint64 pad = std::max<qint64>(0, static_cast<qint64>(m_config.paddingSeconds * sampleRate));

    QVector<Segment> padded = cutRanges(samples, sampleRate);
    for (Segment &seg : padded) {
        seg.start = std::max<qint64>(0, seg.start - pad);
        seg.end = std::min(len, seg.end + pad);
    }
    return padded;
}
