#include <unity.h>

#include <nlohmann/json.hpp>

#include "AvatarConfig.hpp"

using namespace AVATAR;
using nlohmann::json;

void setUp(void) {
}

void tearDown(void) {
}

void test_defaults(void) {
    AvatarConfig config;
    TEST_ASSERT_EQUAL_STRING("assistant", config.avatar_id.c_str());
    TEST_ASSERT_FALSE(config.allow_local_audio);
    TEST_ASSERT_FALSE(config.has_random_seed);
    TEST_ASSERT_EQUAL_FLOAT(0.03f, config.envelope.gate_threshold);
    TEST_ASSERT_EQUAL_FLOAT(0.04f, config.envelope.attack_tau);
    TEST_ASSERT_EQUAL_FLOAT(0.22f, config.envelope.release_tau);
    TEST_ASSERT_EQUAL_INT(2048, static_cast<int>(config.envelope.window));
    TEST_ASSERT_EQUAL_FLOAT(18.0f, config.mouth_damping);
    TEST_ASSERT_EQUAL_INT(6, static_cast<int>(config.pose_correction.size()));
    TEST_ASSERT_EQUAL_INT(10, static_cast<int>(config.idle_joints.size()));
    TEST_ASSERT_EQUAL_FLOAT(-80.0f, config.rest_roll_deg[JointRole::LeftUpperArm]);
}

void test_fields_are_read(void) {
    json j = {
        { "avatar_id", "host" },
        { "allow_local_audio", true },
        { "mirror_arms", true },
        { "random_seed", 1234 },
        { "envelope", { { "gate", 0.05 }, { "attack_ms", 25 }, { "release_ms", 300 }, { "window", 1024 } } },
        { "viseme_window_ms", 250 },
        { "viseme_weight", 0.5 },
        { "pose_correction", json::array({ { { "joint", "J_Bip_L_UpperArm" }, { "roll_deg", -70 } } }) },
        { "idle_joints", { { "head", "Head" } } },
        { "rest_roll_deg", { { "leftUpperArm", -60 } } }
    };

    AvatarConfig config;
    TEST_ASSERT_TRUE(LoadAvatarConfig(j, config));
    TEST_ASSERT_EQUAL_STRING("host", config.avatar_id.c_str());
    TEST_ASSERT_TRUE(config.allow_local_audio);
    TEST_ASSERT_TRUE(config.mirror_arms);
    TEST_ASSERT_TRUE(config.has_random_seed);
    TEST_ASSERT_EQUAL_UINT32(1234, config.random_seed);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.05f, config.envelope.gate_threshold);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.025f, config.envelope.attack_tau);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.3f, config.envelope.release_tau);
    TEST_ASSERT_EQUAL_INT(1024, static_cast<int>(config.envelope.window));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.25f, static_cast<float>(config.viseme_window));
    TEST_ASSERT_EQUAL_FLOAT(0.5f, config.viseme_weight);

    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(config.pose_correction.size()));
    TEST_ASSERT_EQUAL_FLOAT(-70.0f, config.pose_correction[0].roll_deg);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, config.pose_correction[0].pitch_deg);

    // Role maps merge over the defaults.
    TEST_ASSERT_EQUAL_STRING("Head", config.idle_joints[JointRole::Head].c_str());
    TEST_ASSERT_EQUAL_STRING("J_Bip_C_Neck", config.idle_joints[JointRole::Neck].c_str());
    TEST_ASSERT_EQUAL_FLOAT(-60.0f, config.rest_roll_deg[JointRole::LeftUpperArm]);
    TEST_ASSERT_EQUAL_FLOAT(80.0f, config.rest_roll_deg[JointRole::RightUpperArm]);
}

void test_bad_fields_keep_defaults(void) {
    json j = {
        { "avatar_id", 12 },
        { "allow_local_audio", "yes" },
        { "random_seed", -4 },
        { "envelope", { { "gain", "loud" }, { "window", 0 }, { "release_ms", -5 } } },
        { "viseme_weight", 3.0 },
        { "idle_joints", { { "tail", "J_Tail" }, { "head", 5 } } }
    };

    AvatarConfig config;
    TEST_ASSERT_TRUE(LoadAvatarConfig(j, config));
    TEST_ASSERT_EQUAL_STRING("assistant", config.avatar_id.c_str());
    TEST_ASSERT_FALSE(config.allow_local_audio);
    TEST_ASSERT_FALSE(config.has_random_seed);
    TEST_ASSERT_EQUAL_FLOAT(2.0f, config.envelope.gain);
    TEST_ASSERT_EQUAL_INT(2048, static_cast<int>(config.envelope.window));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.22f, config.envelope.release_tau);
    TEST_ASSERT_EQUAL_FLOAT(0.9f, config.viseme_weight);
    TEST_ASSERT_EQUAL_INT(10, static_cast<int>(config.idle_joints.size()));
    TEST_ASSERT_EQUAL_STRING("J_Bip_C_Head", config.idle_joints[JointRole::Head].c_str());
}

void test_non_object_is_rejected(void) {
    AvatarConfig config;
    TEST_ASSERT_FALSE(LoadAvatarConfig(json::array({ 1, 2 }), config));
    TEST_ASSERT_FALSE(LoadAvatarConfig(json("assistant"), config));
    TEST_ASSERT_TRUE(LoadAvatarConfig(json::object(), config));
}

void test_missing_file_keeps_defaults(void) {
    AvatarConfig config;
    TEST_ASSERT_FALSE(LoadAvatarConfigFile("no/such/avatar_config.json", config));
    TEST_ASSERT_EQUAL_STRING("assistant", config.avatar_id.c_str());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_fields_are_read);
    RUN_TEST(test_bad_fields_keep_defaults);
    RUN_TEST(test_non_object_is_rejected);
    RUN_TEST(test_missing_file_keeps_defaults);
    return UNITY_END();
}
