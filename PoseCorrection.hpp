#ifndef POSE_CORRECTION_H_
#define POSE_CORRECTION_H_

#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>

#include "RenderingBackend.hpp"

namespace AVATAR {

    struct CorrectionEntry {
        std::string joint;
        float pitch_deg = 0.0f;
        float roll_deg = 0.0f;
    };

    // Relaxes a T-pose rest skeleton into a natural arm hang. The corrected
    // rotations are forced every frame, after any other joint writer.
    class PoseCorrection {
    public:
        PoseCorrection();
        PoseCorrection(std::vector<CorrectionEntry> entries, bool mirror);

        static std::vector<CorrectionEntry> DefaultEntries();

        // Resolves joints and computes base * offset for each. Call right
        // after the skeleton loads; returns the number of joints found.
        std::size_t Capture(CharacterRig& rig);
        void Release();

        void Apply() const;

        // Rotation forced onto `joint`, if it is one of the corrected joints.
        bool GetCorrected(const std::string& joint, glm::quat& rotation) const;

        const std::vector<CorrectionEntry>& GetEntries() const { return entries_; }
        bool IsMirrored() const { return mirror_; }
        std::size_t GetCapturedCount() const { return targets_.size(); }

    private:
        struct Target {
            JointHandle* joint;
            glm::quat base;
            glm::quat corrected;
        };

        std::vector<CorrectionEntry> entries_;
        bool mirror_ = false;
        std::vector<Target> targets_;
    };

}  // namespace AVATAR

#endif
