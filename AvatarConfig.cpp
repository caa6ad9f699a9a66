#include "AvatarConfig.hpp"

#include <fstream>
#include <iostream>

namespace AVATAR {

    using json = nlohmann::json;

    namespace {

        void Warn(const std::string& field, const char* expected) {
            std::cerr << "[Config] WARNING: '" << field << "' should be " << expected
                << ", keeping default\n";
        }

        void ReadFloat(const json& j, const char* key, float& out) {
            auto it = j.find(key);
            if (it == j.end()) {
                return;
            }
            if (!it->is_number()) {
                Warn(key, "a number");
                return;
            }
            out = it->get<float>();
        }

        // Milliseconds on disk, seconds in memory.
        void ReadMillis(const json& j, const char* key, float& seconds) {
            float ms = seconds * 1000.0f;
            ReadFloat(j, key, ms);
            if (ms < 0.0f) {
                Warn(key, "non-negative");
                return;
            }
            seconds = ms / 1000.0f;
        }

        void ReadBool(const json& j, const char* key, bool& out) {
            auto it = j.find(key);
            if (it == j.end()) {
                return;
            }
            if (!it->is_boolean()) {
                Warn(key, "a boolean");
                return;
            }
            out = it->get<bool>();
        }

        void ReadEnvelope(const json& j, EnvelopeConfig& env) {
            ReadFloat(j, "gate", env.gate_threshold);
            ReadMillis(j, "attack_ms", env.attack_tau);
            ReadMillis(j, "release_ms", env.release_tau);
            ReadMillis(j, "rms_ms", env.rms_tau);
            ReadFloat(j, "gain", env.gain);
            ReadFloat(j, "scale", env.scale);

            auto it = j.find("window");
            if (it != j.end()) {
                if (it->is_number_unsigned() && it->get<std::size_t>() > 0) {
                    env.window = it->get<std::size_t>();
                }
                else {
                    Warn("envelope.window", "a positive integer");
                }
            }
        }

        void ReadCorrections(const json& arr, std::vector<CorrectionEntry>& out) {
            std::vector<CorrectionEntry> entries;
            for (const json& item : arr) {
                if (!item.is_object() || !item.contains("joint") || !item["joint"].is_string()) {
                    std::cerr << "[Config] WARNING: skipping pose_correction entry "
                        << item.dump() << "\n";
                    continue;
                }
                CorrectionEntry e;
                e.joint = item["joint"].get<std::string>();
                ReadFloat(item, "pitch_deg", e.pitch_deg);
                ReadFloat(item, "roll_deg", e.roll_deg);
                entries.push_back(e);
            }
            out = entries;
        }

        template <typename T, typename Read>
        void ReadRoleMap(const json& obj, const char* field, std::map<JointRole, T>& out, Read read) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                JointRole role;
                if (!JointRoleFromString(it.key(), role)) {
                    std::cerr << "[Config] WARNING: unknown joint role '" << it.key()
                        << "' in " << field << "\n";
                    continue;
                }
                T value;
                if (!read(it.value(), value)) {
                    Warn(std::string(field) + "." + it.key(), "of the right type");
                    continue;
                }
                out[role] = value;
            }
        }

    }  // namespace

    std::map<JointRole, std::string> AvatarConfig::DefaultIdleJoints() {
        return {
            { JointRole::Spine, "J_Bip_C_Spine" },
            { JointRole::Chest, "J_Bip_C_Chest" },
            { JointRole::Neck, "J_Bip_C_Neck" },
            { JointRole::Head, "J_Bip_C_Head" },
            { JointRole::LeftShoulder, "J_Bip_L_Shoulder" },
            { JointRole::RightShoulder, "J_Bip_R_Shoulder" },
            { JointRole::LeftUpperArm, "J_Bip_L_UpperArm" },
            { JointRole::RightUpperArm, "J_Bip_R_UpperArm" },
            { JointRole::LeftLowerArm, "J_Bip_L_LowerArm" },
            { JointRole::RightLowerArm, "J_Bip_R_LowerArm" },
        };
    }

    std::map<JointRole, float> AvatarConfig::DefaultRestRoll() {
        return {
            { JointRole::LeftShoulder, -15.0f },
            { JointRole::RightShoulder, 15.0f },
            { JointRole::LeftUpperArm, -80.0f },
            { JointRole::RightUpperArm, 80.0f },
            { JointRole::LeftLowerArm, -25.0f },
            { JointRole::RightLowerArm, 25.0f },
        };
    }

    bool LoadAvatarConfig(const json& j, AvatarConfig& config) {
        if (!j.is_object()) {
            std::cerr << "[Config] ERROR: configuration must be a JSON object\n";
            return false;
        }

        auto id = j.find("avatar_id");
        if (id != j.end()) {
            if (id->is_string() && !id->get<std::string>().empty()) {
                config.avatar_id = id->get<std::string>();
            }
            else {
                Warn("avatar_id", "a non-empty string");
            }
        }

        ReadBool(j, "allow_local_audio", config.allow_local_audio);
        ReadBool(j, "mirror_arms", config.mirror_arms);

        auto seed = j.find("random_seed");
        if (seed != j.end() && !seed->is_null()) {
            if (seed->is_number_unsigned()) {
                config.has_random_seed = true;
                config.random_seed = seed->get<uint32_t>();
            }
            else {
                Warn("random_seed", "an unsigned integer");
            }
        }

        auto env = j.find("envelope");
        if (env != j.end()) {
            if (env->is_object()) {
                ReadEnvelope(*env, config.envelope);
            }
            else {
                Warn("envelope", "an object");
            }
        }

        ReadFloat(j, "mouth_damping", config.mouth_damping);
        float window_sec = static_cast<float>(config.viseme_window);
        ReadMillis(j, "viseme_window_ms", window_sec);
        config.viseme_window = window_sec;
        ReadFloat(j, "viseme_weight", config.viseme_weight);
        if (config.viseme_weight < 0.0f || config.viseme_weight > 1.0f) {
            Warn("viseme_weight", "within [0, 1]");
            config.viseme_weight = 0.9f;
        }

        auto corr = j.find("pose_correction");
        if (corr != j.end()) {
            if (corr->is_array()) {
                ReadCorrections(*corr, config.pose_correction);
            }
            else {
                Warn("pose_correction", "an array");
            }
        }

        auto joints = j.find("idle_joints");
        if (joints != j.end()) {
            if (joints->is_object()) {
                ReadRoleMap<std::string>(*joints, "idle_joints", config.idle_joints,
                    [](const json& v, std::string& out) {
                        if (!v.is_string()) return false;
                        out = v.get<std::string>();
                        return true;
                    });
            }
            else {
                Warn("idle_joints", "an object");
            }
        }

        auto roll = j.find("rest_roll_deg");
        if (roll != j.end()) {
            if (roll->is_object()) {
                ReadRoleMap<float>(*roll, "rest_roll_deg", config.rest_roll_deg,
                    [](const json& v, float& out) {
                        if (!v.is_number()) return false;
                        out = v.get<float>();
                        return true;
                    });
            }
            else {
                Warn("rest_roll_deg", "an object");
            }
        }

        return true;
    }

    bool LoadAvatarConfigFile(const std::string& path, AvatarConfig& config) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[Config] WARNING: could not open " << path << ", using defaults\n";
            return false;
        }

        json j;
        try {
            file >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "[Config] ERROR: failed to parse " << path << ": " << e.what() << "\n";
            return false;
        }

        if (!LoadAvatarConfig(j, config)) {
            return false;
        }
        std::cout << "[Config] loaded " << path << " (avatar " << config.avatar_id << ")\n";
        return true;
    }

}  // namespace AVATAR
