#include <unity.h>

#include <cmath>
#include <memory>

#include <glm/gtc/quaternion.hpp>

#include "AvatarConfig.hpp"
#include "IdleMotion.hpp"
#include "JsonRig.hpp"
#include "PoseCorrection.hpp"
#include "TestRig.hpp"

using namespace AVATAR;

namespace {
    bool SameQuat(const glm::quat& a, const glm::quat& b) {
        return std::abs(std::abs(glm::dot(a, b)) - 1.0f) < 1e-5f;
    }

    glm::quat Expected(float pitch_deg, float roll_deg) {
        return EulerXYZ(glm::vec3(glm::radians(pitch_deg), 0.0f, glm::radians(roll_deg)));
    }
}

void setUp(void) {
}

void tearDown(void) {
}

void test_capture_applies_corrections_immediately(void) {
    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(test::MakeRigDescription(true));

    PoseCorrection pose;
    TEST_ASSERT_EQUAL_INT(6, static_cast<int>(pose.Capture(*rig)));
    TEST_ASSERT_TRUE(SameQuat(Expected(-10.0f, -65.0f),
        rig->FindJoint("J_Bip_L_UpperArm")->GetRotation()));
    TEST_ASSERT_TRUE(SameQuat(Expected(-18.0f, 8.0f),
        rig->FindJoint("J_Bip_R_LowerArm")->GetRotation()));
}

void test_mirror_negates_roll(void) {
    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(test::MakeRigDescription(true));

    PoseCorrection pose(PoseCorrection::DefaultEntries(), true);
    pose.Capture(*rig);

    glm::quat rotation;
    TEST_ASSERT_TRUE(pose.GetCorrected("J_Bip_L_UpperArm", rotation));
    TEST_ASSERT_TRUE(SameQuat(Expected(-10.0f, 65.0f), rotation));
    TEST_ASSERT_TRUE(pose.IsMirrored());
}

void test_correction_composes_onto_rest_pose(void) {
    nlohmann::json desc = test::MakeRigDescription(true);
    const glm::quat rest = glm::angleAxis(0.3f, glm::vec3(0.f, 1.f, 0.f));
    for (auto& joint : desc["joints"]) {
        if (joint["name"] == "J_Bip_L_Shoulder") {
            joint["rotation"] = { rest.w, rest.x, rest.y, rest.z };
        }
    }

    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(desc);
    PoseCorrection pose;
    pose.Capture(*rig);

    TEST_ASSERT_TRUE(SameQuat(rest * Expected(-10.0f, -15.0f),
        rig->FindJoint("J_Bip_L_Shoulder")->GetRotation()));
}

void test_missing_joints_are_skipped(void) {
    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(test::MakeRigDescription(false));

    PoseCorrection pose;
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(pose.Capture(*rig)));
    pose.Apply();

    glm::quat rotation;
    TEST_ASSERT_FALSE(pose.GetCorrected("J_Bip_L_UpperArm", rotation));
}

void test_correction_wins_over_idle_motion(void) {
    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(test::MakeRigDescription(true));

    IdleMotionGenerator idle(13);
    idle.CaptureJoints(*rig, AvatarConfig::DefaultIdleJoints(), AvatarConfig::DefaultRestRoll());
    PoseCorrection pose;
    pose.Capture(*rig);

    for (int frame = 0; frame < 120; ++frame) {
        idle.Advance(1.0f / 60.0f);
        idle.Apply();
        pose.Apply();

        for (const CorrectionEntry& e : pose.GetEntries()) {
            glm::quat corrected;
            TEST_ASSERT_TRUE(pose.GetCorrected(e.joint, corrected));
            TEST_ASSERT_TRUE(SameQuat(corrected, rig->FindJoint(e.joint)->GetRotation()));
        }
    }
}

void test_release_stops_writes(void) {
    JsonRigBackend backend;
    std::unique_ptr<CharacterRig> rig = backend.LoadCharacterFromJson(test::MakeRigDescription(true));
    std::shared_ptr<RigStats> stats = backend.GetStats();

    PoseCorrection pose;
    pose.Capture(*rig);
    pose.Release();
    unsigned long writes = stats->joint_writes;
    pose.Apply();
    TEST_ASSERT_EQUAL_UINT32(writes, stats->joint_writes);
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(pose.GetCapturedCount()));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_capture_applies_corrections_immediately);
    RUN_TEST(test_mirror_negates_roll);
    RUN_TEST(test_correction_composes_onto_rest_pose);
    RUN_TEST(test_missing_joints_are_skipped);
    RUN_TEST(test_correction_wins_over_idle_motion);
    RUN_TEST(test_release_stops_writes);
    return UNITY_END();
}
