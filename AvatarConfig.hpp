#ifndef AVATAR_CONFIG_H_
#define AVATAR_CONFIG_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "EnvelopeExtractor.hpp"
#include "IdleMotion.hpp"
#include "PoseCorrection.hpp"

namespace AVATAR {

    struct AvatarConfig {
        std::string avatar_id = "assistant";
        bool allow_local_audio = false;
        bool mirror_arms = false;
        bool has_random_seed = false;
        uint32_t random_seed = 0;

        EnvelopeConfig envelope;
        float mouth_damping = 18.0f;    // 1/s
        double viseme_window = 0.180;   // seconds
        float viseme_weight = 0.9f;

        std::vector<CorrectionEntry> pose_correction = PoseCorrection::DefaultEntries();
        std::map<JointRole, std::string> idle_joints = DefaultIdleJoints();
        std::map<JointRole, float> rest_roll_deg = DefaultRestRoll();

        static std::map<JointRole, std::string> DefaultIdleJoints();
        static std::map<JointRole, float> DefaultRestRoll();
    };

    // Every field is optional; missing or ill-typed fields keep their default
    // and log a warning. Returns false only when the input is not a JSON object.
    bool LoadAvatarConfig(const nlohmann::json& j, AvatarConfig& config);
    // false when the file cannot be opened or parsed; `config` keeps defaults.
    bool LoadAvatarConfigFile(const std::string& path, AvatarConfig& config);

}  // namespace AVATAR

#endif
