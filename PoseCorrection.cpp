#include "PoseCorrection.hpp"

#include <iostream>
#include <utility>

#include "IdleMotion.hpp"

namespace AVATAR {

    PoseCorrection::PoseCorrection()
        : entries_(DefaultEntries()) {
    }

    PoseCorrection::PoseCorrection(std::vector<CorrectionEntry> entries, bool mirror)
        : entries_(std::move(entries)), mirror_(mirror) {
    }

    std::vector<CorrectionEntry> PoseCorrection::DefaultEntries() {
        return {
            // Shoulders: downward tilt with some outward roll.
            { "J_Bip_L_Shoulder", -10.0f, -15.0f },
            { "J_Bip_R_Shoulder", -10.0f, 15.0f },
            // Upper arms hang down, flared enough to clear the hips.
            { "J_Bip_L_UpperArm", -10.0f, -65.0f },
            { "J_Bip_R_UpperArm", -10.0f, 65.0f },
            // Lower arms: mild bend.
            { "J_Bip_L_LowerArm", -18.0f, -8.0f },
            { "J_Bip_R_LowerArm", -18.0f, 8.0f },
        };
    }

    std::size_t PoseCorrection::Capture(CharacterRig& rig) {
        targets_.clear();
        const float sign = mirror_ ? -1.0f : 1.0f;

        for (const CorrectionEntry& e : entries_) {
            JointHandle* joint = rig.FindJoint(e.joint);
            if (joint == nullptr) {
                std::cerr << "[PoseCorrection] WARNING: joint missing: " << e.joint << "\n";
                continue;
            }

            glm::quat base = joint->GetRotation();
            glm::quat offset = EulerXYZ(glm::vec3(
                glm::radians(e.pitch_deg), 0.0f, glm::radians(e.roll_deg * sign)));
            targets_.push_back(Target{ joint, base, base * offset });
        }

        Apply();
        return targets_.size();
    }

    void PoseCorrection::Release() {
        targets_.clear();
    }

    void PoseCorrection::Apply() const {
        for (const Target& t : targets_) {
            t.joint->SetRotation(t.corrected);
        }
    }

    bool PoseCorrection::GetCorrected(const std::string& joint, glm::quat& rotation) const {
        for (const Target& t : targets_) {
            if (t.joint->GetName() == joint) {
                rotation = t.corrected;
                return true;
            }
        }
        return false;
    }

}  // namespace AVATAR
