#include <unity.h>

#include <cmath>
#include <memory>
#include <vector>

#include <glm/gtc/quaternion.hpp>

#include "AvatarAnimator.hpp"
#include "JsonRig.hpp"
#include "TestRig.hpp"

using namespace AVATAR;
using AVATAR::test::FakeTrack;

namespace {
    const double kFrame = 1.0 / 60.0;

    AvatarConfig SeededConfig() {
        AvatarConfig config;
        config.has_random_seed = true;
        config.random_seed = 99;
        return config;
    }

    // Runs frames up to (and including) `until`, continuing from `frame`.
    void RunUntil(AvatarAnimator& animator, int& frame, double until) {
        while (frame * kFrame < until - 1e-9) {
            ++frame;
            animator.Tick(kFrame, frame * kFrame);
        }
    }

    std::shared_ptr<EnvelopeExtractor> LoudExtractor(std::shared_ptr<FakeTrack>& track) {
        EnvelopeConfig cfg;
        cfg.rms_tau = 1e-4f;
        auto extractor = std::make_shared<EnvelopeExtractor>(cfg);
        track = std::make_shared<FakeTrack>("agent", false, TrackKind::Audio, true);
        extractor->Attach(track);

        std::vector<float> loud(4096, 0.5f);
        track->GetRing()->Push(loud.data(), loud.size());
        for (int i = 0; i < 30; ++i) {
            extractor->Tick();
        }
        return extractor;
    }
}

void setUp(void) {
}

void tearDown(void) {
}

void test_load_status(void) {
    JsonRigBackend backend;
    AvatarAnimator missing(backend, SeededConfig());
    TEST_ASSERT_EQUAL_STRING("loading", ToString(missing.GetStatus()));
    TEST_ASSERT_EQUAL_STRING("error", ToString(missing.Initialize("no/such/rig.json")));

    // Ticking a failed load is a no-op.
    missing.Tick(kFrame, kFrame);
    TEST_ASSERT_EQUAL_UINT32(0, backend.GetStats()->frames);

    AvatarAnimator ok(backend, SeededConfig());
    TEST_ASSERT_EQUAL_STRING("ready",
        ToString(ok.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()))));
    TEST_ASSERT_NOT_NULL(ok.GetRig());
}

void test_mouth_stays_closed_without_envelope(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    int frame = 0;
    RunUntil(animator, frame, 1.0);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, animator.GetMouth());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, animator.GetRig()->GetExpression(kMouthOpenChannel));
}

void test_mouth_follows_envelope(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    std::shared_ptr<FakeTrack> track;
    animator.BindEnvelope(LoudExtractor(track));

    int frame = 0;
    RunUntil(animator, frame, 0.5);
    TEST_ASSERT_TRUE(animator.GetMouth() > 0.9f);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, animator.GetMouth(),
        animator.GetRig()->GetExpression(kMouthOpenChannel));

    animator.SetLipSyncMode(LipSyncMode::Muted);
    RunUntil(animator, frame, 1.5);
    TEST_ASSERT_TRUE(animator.GetMouth() < 0.01f);
}

void test_viseme_hint_shapes_mouth_briefly(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    std::shared_ptr<FakeTrack> track;
    animator.BindEnvelope(LoudExtractor(track));

    int frame = 0;
    RunUntil(animator, frame, 1.0);
    TEST_ASSERT_TRUE(animator.OnTranscript("see", false, 1.0));
    TEST_ASSERT_FALSE(animator.OnTranscript("ooh", true, 1.0));

    CharacterRig* rig = animator.GetRig();
    RunUntil(animator, frame, 1.1);
    TEST_ASSERT_TRUE(rig->GetExpression(kMouthNarrowChannel) > 0.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rig->GetExpression(kMouthRoundChannel));

    RunUntil(animator, frame, 1.2);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rig->GetExpression(kMouthNarrowChannel));
    TEST_ASSERT_TRUE(rig->GetExpression(kMouthOpenChannel) > 0.9f);
}

void test_viseme_window_starts_at_delivery_time(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    std::shared_ptr<FakeTrack> track;
    animator.BindEnvelope(LoudExtractor(track));

    // The host delivers transcript before ticking, so the fragment carries
    // the upcoming frame's time rather than the last tick's.
    int frame = 0;
    RunUntil(animator, frame, 1.0);
    TEST_ASSERT_TRUE(animator.OnTranscript("see", false, 1.1));

    CharacterRig* rig = animator.GetRig();
    RunUntil(animator, frame, 1.25);
    TEST_ASSERT_TRUE(rig->GetExpression(kMouthNarrowChannel) > 0.0f);

    RunUntil(animator, frame, 1.3);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rig->GetExpression(kMouthNarrowChannel));
}

void test_dispose_stops_all_writes(void) {
    JsonRigBackend backend;
    std::shared_ptr<RigStats> stats = backend.GetStats();
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    std::shared_ptr<FakeTrack> track;
    std::shared_ptr<EnvelopeExtractor> extractor = LoudExtractor(track);
    animator.BindEnvelope(extractor);

    int frame = 0;
    RunUntil(animator, frame, 0.25);
    animator.Dispose();
    TEST_ASSERT_TRUE(animator.IsDisposed());
    TEST_ASSERT_TRUE(extractor->IsDisposed());
    TEST_ASSERT_NULL(animator.GetRig());

    const RigStats before = *stats;
    test::FeedConstant(*extractor, 0.5f, 10);
    RunUntil(animator, frame, 1.0);

    TEST_ASSERT_EQUAL_UINT32(before.joint_writes, stats->joint_writes);
    TEST_ASSERT_EQUAL_UINT32(before.expression_writes, stats->expression_writes);
    TEST_ASSERT_EQUAL_UINT32(before.frames, stats->frames);
    TEST_ASSERT_FALSE(animator.OnTranscript("see", false, 1.0));
    TEST_ASSERT_EQUAL_STRING("error",
        ToString(animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()))));
}

void test_frame_order_keeps_arm_correction(void) {
    JsonRigBackend backend;
    std::shared_ptr<RigStats> stats = backend.GetStats();
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    int frame = 0;
    RunUntil(animator, frame, 2.0);
    TEST_ASSERT_EQUAL_UINT32(static_cast<unsigned long>(frame), stats->frames);
    TEST_ASSERT_EQUAL_UINT32(static_cast<unsigned long>(frame), stats->updates);
    TEST_ASSERT_EQUAL_UINT32(static_cast<unsigned long>(frame), stats->clip_advances);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 2.0f, static_cast<float>(backend.GetClipTime()));
    TEST_ASSERT_EQUAL_UINT32(static_cast<unsigned long>(frame), stats->look_at_writes);

    const PoseCorrection& pose = animator.GetPoseCorrection();
    TEST_ASSERT_EQUAL_INT(6, static_cast<int>(pose.GetCapturedCount()));
    for (const CorrectionEntry& e : pose.GetEntries()) {
        glm::quat corrected;
        TEST_ASSERT_TRUE(pose.GetCorrected(e.joint, corrected));
        glm::quat actual = animator.GetRig()->FindJoint(e.joint)->GetRotation();
        TEST_ASSERT_FLOAT_WITHIN(1e-5f, 1.0f, std::abs(glm::dot(corrected, actual)));
    }
}

void test_preset_fades_in_and_out(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));
    CharacterRig* rig = animator.GetRig();

    animator.PlayPreset(ExpressionPreset::Smile);
    int frame = 0;
    RunUntil(animator, frame, 0.05);
    float rising = rig->GetExpression("happy");
    TEST_ASSERT_TRUE(rising > 0.0f && rising < 0.5f);

    RunUntil(animator, frame, 0.5);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 1.0f, rig->GetExpression("happy"));
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 1.0f, animator.GetPresetWeight(ExpressionPreset::Smile));

    RunUntil(animator, frame, 2.5);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rig->GetExpression("happy"));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, animator.GetPresetWeight(ExpressionPreset::Smile));
}

void test_blink_preset_triggers_blink(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.Initialize(backend.LoadCharacterFromJson(test::MakeRigDescription()));

    animator.PlayPreset(ExpressionPreset::Blink);
    int frame = 0;
    RunUntil(animator, frame, 0.08);
    TEST_ASSERT_TRUE(animator.GetRig()->GetExpression(kBlinkChannel) > 0.9f);
}

void test_voice_reactiveness_is_clamped(void) {
    JsonRigBackend backend;
    AvatarAnimator animator(backend, SeededConfig());
    animator.SetVoiceReactiveness(3.0f);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, animator.GetVoiceReactiveness());
    animator.SetVoiceReactiveness(-1.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, animator.GetVoiceReactiveness());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_load_status);
    RUN_TEST(test_mouth_stays_closed_without_envelope);
    RUN_TEST(test_mouth_follows_envelope);
    RUN_TEST(test_viseme_hint_shapes_mouth_briefly);
    RUN_TEST(test_viseme_window_starts_at_delivery_time);
    RUN_TEST(test_dispose_stops_all_writes);
    RUN_TEST(test_frame_order_keeps_arm_correction);
    RUN_TEST(test_preset_fades_in_and_out);
    RUN_TEST(test_blink_preset_triggers_blink);
    RUN_TEST(test_voice_reactiveness_is_clamped);
    return UNITY_END();
}
