#include "JsonRig.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace AVATAR {

    using json = nlohmann::json;

    namespace {
        bool ReadVec3(const json& j, glm::vec3& out) {
            if (!j.is_array() || j.size() != 3) {
                return false;
            }
            for (std::size_t i = 0; i < 3; ++i) {
                if (!j[i].is_number()) {
                    return false;
                }
                out[static_cast<int>(i)] = j[i].get<float>();
            }
            return true;
        }

        bool ReadQuat(const json& j, glm::quat& out) {
            if (!j.is_array() || j.size() != 4) {
                return false;
            }
            for (const json& v : j) {
                if (!v.is_number()) {
                    return false;
                }
            }
            out = glm::normalize(glm::quat(j[0].get<float>(), j[1].get<float>(),
                j[2].get<float>(), j[3].get<float>()));
            return true;
        }
    }  // namespace

    // -----------------------------------------------------------------------------
    // Joints
    // -----------------------------------------------------------------------------
    JsonJoint::JsonJoint(const std::string& name, const glm::quat& rest,
        const std::shared_ptr<RigStats>& stats)
        : name_(name), rotation_(rest), stats_(stats) {
    }

    void JsonJoint::SetRotation(const glm::quat& rotation) {
        rotation_ = rotation;
        ++stats_->joint_writes;
        stats_->last_joint_written = name_;
    }

    // -----------------------------------------------------------------------------
    // Rig
    // -----------------------------------------------------------------------------
    JsonRig::JsonRig(const std::shared_ptr<RigStats>& stats)
        : stats_(stats) {
    }

    bool JsonRig::Load(const json& j) {
        if (!j.is_object()) {
            std::cerr << "[Rig] ERROR: rig description must be an object\n";
            return false;
        }
        if (!j.contains("joints") || !j["joints"].is_array()) {
            std::cerr << "[Rig] ERROR: rig description missing joints\n";
            return false;
        }

        if (j.contains("name") && j["name"].is_string()) {
            name_ = j["name"].get<std::string>();
        }

        for (const json& entry : j["joints"]) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
                std::cerr << "[Rig] WARNING: skipping joint entry " << entry.dump() << "\n";
                continue;
            }
            const std::string name = entry["name"].get<std::string>();
            if (joint_lookup_.count(name) != 0) {
                std::cerr << "[Rig] WARNING: duplicate joint " << name << "\n";
                continue;
            }

            glm::quat rest(1.0f, 0.0f, 0.0f, 0.0f);
            if (entry.contains("rotation") && !ReadQuat(entry["rotation"], rest)) {
                std::cerr << "[Rig] WARNING: joint " << name
                    << " has a bad rotation, using identity\n";
            }

            joints_.push_back(std::make_unique<JsonJoint>(name, rest, stats_));
            joint_lookup_[name] = joints_.back().get();
        }

        if (j.contains("expressions") && j["expressions"].is_array()) {
            for (const json& e : j["expressions"]) {
                if (e.is_string()) {
                    expression_names_.push_back(e.get<std::string>());
                }
            }
        }

        if (j.contains("bounds") && j["bounds"].is_object()) {
            const json& b = j["bounds"];
            if ((b.contains("center") && !ReadVec3(b["center"], bounds_.center)) ||
                (b.contains("size") && !ReadVec3(b["size"], bounds_.size))) {
                std::cerr << "[Rig] WARNING: malformed bounds\n";
            }
        }

        std::cout << "[Rig] loaded " << (name_.empty() ? "<unnamed>" : name_)
            << "  (#joints = " << joints_.size()
            << ", #expressions = " << expression_names_.size() << ")\n";
        return true;
    }

    JointHandle* JsonRig::FindJoint(const std::string& name) {
        auto it = joint_lookup_.find(name);
        return it == joint_lookup_.end() ? nullptr : it->second;
    }

    bool JsonRig::HasExpression(const std::string& name) const {
        return std::find(expression_names_.begin(), expression_names_.end(), name)
            != expression_names_.end();
    }

    float JsonRig::GetExpression(const std::string& name) const {
        auto it = active_weights_.find(name);
        return it == active_weights_.end() ? 0.0f : it->second;
    }

    void JsonRig::SetExpression(const std::string& name, float weight) {
        weight = std::max(0.0f, std::min(1.0f, weight));

        if (name.empty() || name == "NEUTRAL") {
            ClearExpressions(true);
            ++stats_->expression_writes;
            return;
        }

        if (!HasExpression(name)) {
            return;
        }

        if (weight <= 0.0f) {
            active_weights_.erase(name);
        }
        else {
            active_weights_[name] = weight;
        }
        ++stats_->expression_writes;
    }

    void JsonRig::ClearExpressions(bool keep_blink) {
        if (!keep_blink) {
            active_weights_.clear();
            return;
        }
        for (auto it = active_weights_.begin(); it != active_weights_.end();) {
            if (it->first.find("blink") != std::string::npos) {
                ++it;
            }
            else {
                it = active_weights_.erase(it);
            }
        }
    }

    void JsonRig::SetLookAtTarget(const glm::vec3& target) {
        look_at_ = target;
        ++stats_->look_at_writes;
    }

    // -----------------------------------------------------------------------------
    // Backend
    // -----------------------------------------------------------------------------
    JsonRigBackend::JsonRigBackend()
        : stats_(std::make_shared<RigStats>()) {
    }

    std::unique_ptr<CharacterRig> JsonRigBackend::LoadCharacter(const std::string& source) {
        std::ifstream file(source);
        if (!file.is_open()) {
            std::cerr << "[Rig] ERROR: could not open rig file " << source << "\n";
            return nullptr;
        }

        json j;
        try {
            file >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "[Rig] ERROR: failed to parse rig file (" << source << "): "
                << e.what() << "\n";
            return nullptr;
        }
        return LoadCharacterFromJson(j);
    }

    std::unique_ptr<CharacterRig> JsonRigBackend::LoadCharacterFromJson(const json& description) {
        std::unique_ptr<JsonRig> rig = std::make_unique<JsonRig>(stats_);
        if (!rig->Load(description)) {
            return nullptr;
        }
        clip_time_ = 0.0;
        return std::move(rig);
    }

    void JsonRigBackend::AdvanceClips(CharacterRig&, double delta_time) {
        clip_time_ += delta_time;
        ++stats_->clip_advances;
    }

    void JsonRigBackend::Update(CharacterRig&, double) {
        ++stats_->updates;
    }

    void JsonRigBackend::RenderFrame(CharacterRig&) {
        ++stats_->frames;
    }

}  // namespace AVATAR
