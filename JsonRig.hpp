#ifndef JSON_RIG_H_
#define JSON_RIG_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <nlohmann/json.hpp>

#include "RenderingBackend.hpp"

namespace AVATAR {

    // Write counters shared between a backend and every rig it loads, so they
    // can be read after the rig itself is gone.
    struct RigStats {
        unsigned long joint_writes = 0;
        unsigned long expression_writes = 0;
        unsigned long look_at_writes = 0;
        unsigned long clip_advances = 0;
        unsigned long updates = 0;
        unsigned long frames = 0;
        std::string last_joint_written;
    };

    class JsonJoint : public JointHandle {
    public:
        JsonJoint(const std::string& name, const glm::quat& rest,
            const std::shared_ptr<RigStats>& stats);

        const std::string& GetName() const override { return name_; }
        glm::quat GetRotation() const override { return rotation_; }
        void SetRotation(const glm::quat& rotation) override;

    private:
        std::string name_;
        glm::quat rotation_;
        std::shared_ptr<RigStats> stats_;
    };

    // Headless character: a flat joint list and a set of named expression
    // channels described by a JSON file.
    //
    //   { "name": "...",
    //     "joints": [ { "name": "J_Bip_C_Head", "rotation": [w, x, y, z] }, ... ],
    //     "expressions": [ "aa", "ih", "ou", "blink", ... ],
    //     "bounds": { "center": [x, y, z], "size": [x, y, z] } }
    class JsonRig : public CharacterRig {
    public:
        explicit JsonRig(const std::shared_ptr<RigStats>& stats);

        // false when the description is unusable; reasons are logged.
        bool Load(const nlohmann::json& j);

        JointHandle* FindJoint(const std::string& name) override;
        bool HasExpression(const std::string& name) const override;
        float GetExpression(const std::string& name) const override;
        // Clamped to [0, 1]. Unknown channels are ignored. "NEUTRAL" clears
        // every channel except blinks.
        void SetExpression(const std::string& name, float weight) override;
        void ClearExpressions(bool keep_blink = false);

        void SetLookAtTarget(const glm::vec3& target) override;
        BoundingInfo GetBounds() const override { return bounds_; }

        const std::string& GetName() const { return name_; }
        glm::vec3 GetLookAtTarget() const { return look_at_; }
        std::size_t GetJointCount() const { return joints_.size(); }

    private:
        std::string name_;
        std::vector<std::unique_ptr<JsonJoint>> joints_;
        std::unordered_map<std::string, JsonJoint*> joint_lookup_;
        std::vector<std::string> expression_names_;
        std::unordered_map<std::string, float> active_weights_;
        glm::vec3 look_at_ = glm::vec3(0.0f);
        BoundingInfo bounds_;
        std::shared_ptr<RigStats> stats_;
    };

    class JsonRigBackend : public RenderingBackend {
    public:
        JsonRigBackend();

        // `source` is a path to a rig description file.
        std::unique_ptr<CharacterRig> LoadCharacter(const std::string& source) override;
        std::unique_ptr<CharacterRig> LoadCharacterFromJson(const nlohmann::json& description);

        void AdvanceClips(CharacterRig& rig, double delta_time) override;
        void Update(CharacterRig& rig, double delta_time) override;
        void RenderFrame(CharacterRig& rig) override;

        std::shared_ptr<RigStats> GetStats() const { return stats_; }
        double GetClipTime() const { return clip_time_; }

    private:
        std::shared_ptr<RigStats> stats_;
        double clip_time_ = 0.0;
    };

}  // namespace AVATAR

#endif
