#include <gtest/gtest.h>

#include "segmenter.h"
#include "testutil.h"

namespace {

constexpr int kRate = 16000;

// Pure tones have a flat energy profile, so the adaptive floor would call
// a tone-only buffer silent. Pin the threshold where the test needs it.
SegmenterConfig fixedThreshold()
{
    SegmenterConfig config;
    config.rmsThreshold = 0.05f;
    return config;
}

void expectContiguousCover(const QVector<Segment> &ranges, qint64 length)
{
    ASSERT_FALSE(ranges.isEmpty());
    EXPECT_EQ(ranges.first().start, 0);
    EXPECT_EQ(ranges.last().end, length);
    for (int i = 1; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].start, ranges[i - 1].end) << "gap before range " << i;
    }
    for (const Segment &s : ranges) {
        EXPECT_GT(s.length(), 0);
    }
}

}

TEST(Segmenter, EmptyBufferYieldsNothing)
{
    Segmenter segmenter;
    EXPECT_TRUE(segmenter.split({}, kRate).isEmpty());
    EXPECT_TRUE(segmenter.cutRanges({}, kRate).isEmpty());
}

TEST(Segmenter, NoSilenceYieldsOneSegment)
{
    const QVector<float> audio = toneBuffer(kRate, 2.5, {{0.0, 2.5}});
    Segmenter segmenter(fixedThreshold());

    const QVector<Segment> segments = segmenter.split(audio, kRate);
    ASSERT_EQ(segments.size(), 1);
    EXPECT_EQ(segments[0], (Segment{0, audio.size()}));
}

TEST(Segmenter, CutsAtTheMiddleOfASilenceGap)
{
    // 1.2 s speech, 600 ms silence, 1.2 s speech.
    const QVector<float> audio = toneBuffer(kRate, 3.0, {{0.0, 1.2}, {1.8, 3.0}});
    Segmenter segmenter;

    const QVector<Segment> ranges = segmenter.cutRanges(audio, kRate);
    ASSERT_EQ(ranges.size(), 2);
    EXPECT_EQ(ranges[0], (Segment{0, 24000}));
    EXPECT_EQ(ranges[1], (Segment{24000, 48000}));

    // 150 ms of padding, clamped at the buffer edges.
    const QVector<Segment> padded = segmenter.split(audio, kRate);
    ASSERT_EQ(padded.size(), 2);
    EXPECT_EQ(padded[0], (Segment{0, 26400}));
    EXPECT_EQ(padded[1], (Segment{21600, 48000}));
}

TEST(Segmenter, ShortSilenceIsNotACut)
{
    // 300 ms gap is below the 500 ms minimum.
    const QVector<float> audio = toneBuffer(kRate, 3.0, {{0.0, 1.4}, {1.7, 3.0}});
    Segmenter segmenter(fixedThreshold());

    EXPECT_EQ(segmenter.cutRanges(audio, kRate).size(), 1);
}

TEST(Segmenter, SilenceTooCloseToTheStartIsSkipped)
{
    // Gap midpoint at 0.6 s, inside the 1 s minimum segment length.
    const QVector<float> audio = toneBuffer(kRate, 3.0, {{0.0, 0.3}, {0.9, 3.0}});
    Segmenter segmenter;

    const QVector<Segment> ranges = segmenter.cutRanges(audio, kRate);
    ASSERT_EQ(ranges.size(), 1);
    EXPECT_EQ(ranges[0], (Segment{0, audio.size()}));
}

TEST(Segmenter, PicksTheLatestQualifyingSilence)
{
    // Gaps centred at 1.5 s and 3.5 s, both reachable from 0.
    const QVector<float> audio = toneBuffer(kRate, 5.0, {{0.0, 1.2}, {1.8, 3.2}, {3.8, 5.0}});
    Segmenter segmenter;

    const QVector<Segment> ranges = segmenter.cutRanges(audio, kRate);
    ASSERT_EQ(ranges.size(), 2);
    EXPECT_EQ(ranges[0].end, 56000);
}

TEST(Segmenter, MaxSegmentBoundsEvenSilentAudio)
{
    SegmenterConfig config;
    config.maxSegmentSeconds = 2.0;
    Segmenter segmenter(config);

    const QVector<float> silent(10 * kRate, 0.0f);
    const QVector<Segment> ranges = segmenter.cutRanges(silent, kRate);

    expectContiguousCover(ranges, silent.size());
    for (const Segment &s : ranges) {
        EXPECT_LE(s.length(), 32000);
    }
}

TEST(Segmenter, MaxSegmentPrefersSilenceBeforeTheLimit)
{
    SegmenterConfig config = fixedThreshold();
    config.maxSegmentSeconds = 2.0;
    Segmenter segmenter(config);

    const QVector<float> audio = toneBuffer(kRate, 6.0, {{0.0, 1.2}, {1.8, 6.0}});
    const QVector<Segment> ranges = segmenter.cutRanges(audio, kRate);

    expectContiguousCover(ranges, audio.size());
    EXPECT_EQ(ranges[0].end, 24000);
    for (const Segment &s : ranges) {
        EXPECT_LE(s.length(), 32000);
    }
}

TEST(Segmenter, RangesCoverTheWholeBuffer)
{
    const QVector<float> audio = toneBuffer(kRate, 7.3,
        {{0.1, 0.9}, {1.6, 2.2}, {2.4, 4.0}, {4.9, 5.1}, {6.0, 7.3}}, 0.2f);
    for (double maxSeconds : {0.0, 1.5, 3.0}) {
        SegmenterConfig config;
        config.maxSegmentSeconds = maxSeconds;
        expectContiguousCover(Segmenter(config).cutRanges(audio, kRate), audio.size());
    }
}

TEST(Segmenter, SameInputSameSegments)
{
    const QVector<float> audio = toneBuffer(kRate, 4.0, {{0.0, 1.0}, {1.7, 2.5}, {3.3, 4.0}});
    SegmenterConfig config;
    config.maxSegmentSeconds = 1.5;

    const QVector<Segment> first = Segmenter(config).split(audio, kRate);
    const QVector<Segment> second = Segmenter(config).split(audio, kRate);
    EXPECT_EQ(first, second);
}

TEST(Segmenter, FixedThresholdOverridesNoiseFloor)
{
    // A quiet tone clears the adaptive floor but not a fixed 0.05.
    const QVector<float> audio = toneBuffer(kRate, 3.0, {{0.0, 1.2}, {1.8, 3.0}}, 0.01f);

    EXPECT_EQ(Segmenter().cutRanges(audio, kRate).size(), 2);

    const SegmenterConfig loud = fixedThreshold();
    // Everything is "silent": one run spanning the buffer, cut at its middle.
    const QVector<Segment> ranges = Segmenter(loud).cutRanges(audio, kRate);
    ASSERT_EQ(ranges.size(), 2);
    EXPECT_EQ(ranges[0].end, 24000);
}

TEST(Segmenter, PercentileInterpolatesLinearly)
{
    EXPECT_FLOAT_EQ(Segmenter::percentile({}, 10.0), 0.0f);
    EXPECT_FLOAT_EQ(Segmenter::percentile({5.0f}, 10.0), 5.0f);
    EXPECT_FLOAT_EQ(Segmenter::percentile({4.0f, 1.0f, 3.0f, 2.0f, 5.0f}, 10.0), 1.4f);
    EXPECT_FLOAT_EQ(Segmenter::percentile({0.0f, 10.0f}, 50.0), 5.0f);
}

TEST(Segmenter, AdaptiveThresholdHasAFloor)
{
    EXPECT_FLOAT_EQ(Segmenter::adaptiveThreshold(QVector<float>(10, 0.0f)), 0.003f);
    EXPECT_FLOAT_EQ(Segmenter::adaptiveThreshold(QVector<float>(10, 0.1f)), 0.25f);
}

TEST(Segmenter, FrameEnergiesIncludeThePartialTail)
{
    const QVector<float> samples(10, 0.5f);
    const QVector<float> energies = Segmenter::frameEnergies(samples, 4);
    ASSERT_EQ(energies.size(), 3);
    for (float e : energies) EXPECT_FLOAT_EQ(e, 0.5f);
    EXPECT_EQ(Segmenter::frameSize(16000, 0.02), 320);
    EXPECT_EQ(Segmenter::frameSize(10, 0.02), 1);
}
