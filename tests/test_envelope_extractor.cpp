#include <unity.h>

#include <cmath>
#include <memory>
#include <vector>

#include "EnvelopeExtractor.hpp"
#include "TestRig.hpp"

using namespace AVATAR;
using AVATAR::test::FakeTrack;
using AVATAR::test::FeedConstant;

namespace {
    const float kTick = EnvelopeExtractor::kTickSeconds;

    // Near-instant RMS smoothing so only attack/release shape the output.
    EnvelopeConfig FastRmsConfig() {
        EnvelopeConfig cfg;
        cfg.rms_tau = 1e-4f;
        return cfg;
    }
}

void setUp(void) {
}

void tearDown(void) {
}

void test_rms_of_constant_window(void) {
    std::vector<float> window(512, -0.5f);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, EnvelopeExtractor::ComputeRms(window.data(), window.size()));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, EnvelopeExtractor::ComputeRms(nullptr, 0));
}

void test_non_finite_samples_do_not_poison_the_signal(void) {
    std::vector<float> window(512, 0.5f);
    window[0] = std::nanf("");
    window[1] = INFINITY;
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, EnvelopeExtractor::ComputeRms(window.data(), window.size()));

    EnvelopeExtractor extractor;
    extractor.ProcessWindow(window.data(), window.size());
    TEST_ASSERT_TRUE(std::isfinite(extractor.GetState().smoothed_rms));

    // Two seconds of loud speech after the glitch still open the mouth.
    FeedConstant(extractor, 0.5f, 120);
    TEST_ASSERT_TRUE(std::isfinite(extractor.GetState().smoothed_rms));
    TEST_ASSERT_TRUE(extractor.GetEnvelope() > 0.9f);
}

void test_envelope_stays_clamped(void) {
    EnvelopeExtractor extractor;
    const float levels[] = { 0.0f, 4.0f, 0.01f, 12.0f, 0.2f, 0.0f, 1.0f, 0.05f };

    for (int round = 0; round < 20; ++round) {
        for (float level : levels) {
            FeedConstant(extractor, level, 3);
            float env = extractor.GetEnvelope();
            TEST_ASSERT_TRUE(env >= 0.0f);
            TEST_ASSERT_TRUE(env <= 1.0f);
            TEST_ASSERT_TRUE(extractor.GetState().target_envelope <= 1.0f);
        }
    }
}

void test_gate_suppresses_room_noise(void) {
    EnvelopeExtractor extractor(FastRmsConfig());
    FeedConstant(extractor, 0.02f, 120);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, extractor.GetEnvelope());
}

void test_attack_rise_time(void) {
    EnvelopeConfig cfg = FastRmsConfig();
    EnvelopeExtractor extractor(cfg);

    // 0.5 RMS saturates the target at 1.
    int ticks = 0;
    while (extractor.GetEnvelope() < 1.0f - std::exp(-1.0f) && ticks < 100) {
        FeedConstant(extractor, 0.5f, 1);
        ++ticks;
    }
    TEST_ASSERT_EQUAL_FLOAT(1.0f, extractor.GetState().target_envelope);

    float rise_time = ticks * kTick;
    TEST_ASSERT_FLOAT_WITHIN(kTick, cfg.attack_tau, rise_time);
}

void test_release_fall_time(void) {
    EnvelopeConfig cfg = FastRmsConfig();
    EnvelopeExtractor extractor(cfg);
    FeedConstant(extractor, 0.5f, 120);
    const float start = extractor.GetEnvelope();
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 1.0f, start);

    int ticks = 0;
    while (extractor.GetEnvelope() > start * std::exp(-1.0f) && ticks < 200) {
        FeedConstant(extractor, 0.0f, 1);
        ++ticks;
    }

    float fall_time = ticks * kTick;
    TEST_ASSERT_FLOAT_WITHIN(kTick, cfg.release_tau, fall_time);
}

void test_follow_uses_attack_going_up_and_release_going_down(void) {
    EnvelopeConfig cfg;
    float up = EnvelopeExtractor::Follow(0.0f, 1.0f, kTick, cfg);
    float down = 1.0f - EnvelopeExtractor::Follow(1.0f, 0.0f, kTick, cfg);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 1.0f - std::exp(-kTick / cfg.attack_tau), up);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 1.0f - std::exp(-kTick / cfg.release_tau), down);
    TEST_ASSERT_TRUE(up > down);
}

void test_attach_reports_missing_track(void) {
    EnvelopeExtractor extractor;
    TEST_ASSERT_EQUAL_INT(static_cast<int>(EnvelopeStatus::NoTrack),
        static_cast<int>(extractor.Attach(nullptr)));
    TEST_ASSERT_EQUAL_STRING("no-track", ToString(extractor.GetStatus()));
    TEST_ASSERT_FALSE(extractor.IsReady());
}

void test_attach_refuses_local_track_unless_allowed(void) {
    auto mic = std::make_shared<FakeTrack>("me", true, TrackKind::Audio, true);

    EnvelopeExtractor strict;
    TEST_ASSERT_EQUAL_STRING("local-track", ToString(strict.Attach(mic)));

    EnvelopeExtractor lenient(EnvelopeConfig(), true);
    TEST_ASSERT_EQUAL_STRING("running", ToString(lenient.Attach(mic)));
}

void test_attach_rejects_video_and_streamless_tracks(void) {
    EnvelopeExtractor extractor;
    auto video = std::make_shared<FakeTrack>("agent", false, TrackKind::Video, true);
    TEST_ASSERT_EQUAL_STRING("non-audio", ToString(extractor.Attach(video)));

    auto empty = std::make_shared<FakeTrack>("agent", false, TrackKind::Audio, false);
    TEST_ASSERT_EQUAL_STRING("no-media", ToString(extractor.Attach(empty)));
}

void test_tick_reads_latest_samples(void) {
    auto agent = std::make_shared<FakeTrack>("agent", false, TrackKind::Audio, true);
    EnvelopeExtractor extractor(FastRmsConfig());
    TEST_ASSERT_EQUAL_STRING("running", ToString(extractor.Attach(agent)));
    TEST_ASSERT_FALSE(extractor.IsReady());

    // Nothing captured yet reads as silence.
    extractor.Tick();
    TEST_ASSERT_TRUE(extractor.IsReady());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, extractor.GetEnvelope());

    std::vector<float> loud(4096, 0.5f);
    agent->GetRing()->Push(loud.data(), loud.size());
    for (int i = 0; i < 30; ++i) {
        extractor.Tick();
    }
    TEST_ASSERT_TRUE(extractor.GetEnvelope() > 0.9f);

    extractor.Detach();
    TEST_ASSERT_EQUAL_STRING("stopped", ToString(extractor.GetStatus()));
    TEST_ASSERT_FALSE(extractor.IsReady());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, extractor.GetEnvelope());
}

void test_dispose_ignores_stale_windows(void) {
    auto agent = std::make_shared<FakeTrack>("agent", false, TrackKind::Audio, true);
    EnvelopeExtractor extractor(FastRmsConfig());
    extractor.Attach(agent);

    int calls = 0;
    extractor.SetListener([&calls](float) { ++calls; });
    FeedConstant(extractor, 0.5f, 5);
    TEST_ASSERT_EQUAL_INT(5, calls);

    extractor.Dispose();
    const float frozen = extractor.GetEnvelope();
    FeedConstant(extractor, 0.5f, 10);
    extractor.Tick();

    TEST_ASSERT_EQUAL_INT(5, calls);
    TEST_ASSERT_EQUAL_FLOAT(frozen, extractor.GetEnvelope());
    TEST_ASSERT_TRUE(extractor.IsDisposed());
    TEST_ASSERT_EQUAL_STRING("disposed", ToString(extractor.GetStatus()));

    // A disposed extractor cannot be re-armed.
    TEST_ASSERT_EQUAL_STRING("disposed", ToString(extractor.Attach(agent)));
}

void test_ring_stream_keeps_newest_samples(void) {
    RingAudioStream ring(4);
    const float first[] = { 1.0f, 2.0f, 3.0f };
    const float second[] = { 4.0f, 5.0f, 6.0f };
    ring.Push(first, 3);
    ring.Push(second, 3);

    std::vector<float> out;
    TEST_ASSERT_TRUE(ring.ReadLatest(8, out));
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(out.size()));
    TEST_ASSERT_EQUAL_FLOAT(3.0f, out[0]);
    TEST_ASSERT_EQUAL_FLOAT(6.0f, out[3]);

    ring.Clear();
    TEST_ASSERT_FALSE(ring.ReadLatest(2, out));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_rms_of_constant_window);
    RUN_TEST(test_non_finite_samples_do_not_poison_the_signal);
    RUN_TEST(test_envelope_stays_clamped);
    RUN_TEST(test_gate_suppresses_room_noise);
    RUN_TEST(test_attack_rise_time);
    RUN_TEST(test_release_fall_time);
    RUN_TEST(test_follow_uses_attack_going_up_and_release_going_down);
    RUN_TEST(test_attach_reports_missing_track);
    RUN_TEST(test_attach_refuses_local_track_unless_allowed);
    RUN_TEST(test_attach_rejects_video_and_streamless_tracks);
    RUN_TEST(test_tick_reads_latest_samples);
    RUN_TEST(test_dispose_ignores_stale_windows);
    RUN_TEST(test_ring_stream_keeps_newest_samples);
    return UNITY_END();
}
