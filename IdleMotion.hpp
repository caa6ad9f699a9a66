#ifndef IDLE_MOTION_H_
#define IDLE_MOTION_H_

#include <array>
#include <map>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "Random.hpp"
#include "RenderingBackend.hpp"

namespace AVATAR {

    enum class JointRole {
        Spine = 0,
        Chest,
        Neck,
        Head,
        LeftShoulder,
        RightShoulder,
        LeftUpperArm,
        RightUpperArm,
        LeftLowerArm,
        RightLowerArm,
        Count
    };

    constexpr std::size_t kJointRoleCount = static_cast<std::size_t>(JointRole::Count);

    const char* ToString(JointRole role);
    bool JointRoleFromString(const std::string& name, JointRole& role);

    // Rotation built from Euler angles applied X, then Y, then Z in the
    // joint's local frame.
    glm::quat EulerXYZ(const glm::vec3& radians);

    // Frame-rate independent exponential approach (lambda in 1/s).
    float ExpDamp(float current, float target, float lambda, float dt);

    struct DampedValue {
        float current = 0.0f;
        float target = 0.0f;

        void Damp(float lambda, float dt);
    };

    struct Oscillator {
        DampedValue amp;
        DampedValue freq;

        float Sample(float t) const;
    };

    // ------------------------------------------------------------------
    // Small polled state machines, advanced once per frame.
    // ------------------------------------------------------------------
    enum class BlinkPhase {
        Open,
        Closing,
        Opening
    };

    struct BlinkState {
        static constexpr float kCloseSeconds = 0.08f;
        static constexpr float kOpenSeconds = 0.12f;

        BlinkPhase phase = BlinkPhase::Open;
        float value = 0.0f;
        float timer = 0.0f;
        float min_interval = 2.5f;
        float max_interval = 5.5f;

        void Advance(float dt, Random& random);
        void Trigger() { phase = BlinkPhase::Closing; }
    };

    enum class TiltPhase {
        Idle,
        MovingToTarget,
        Returning
    };

    struct HeadTiltState {
        static constexpr float kMaxAngle = 0.05f;  // ~3 degrees

        TiltPhase phase = TiltPhase::Idle;
        float value = 0.0f;
        float target = 0.0f;
        float timer = 0.0f;

        void Advance(float dt, Random& random);
    };

    struct GazeState {
        glm::vec2 offset = glm::vec2(0.0f);
        float timer = 0.0f;
        bool enabled = true;
        float min_interval = 1.5f;
        float max_interval = 3.0f;

        void Advance(float dt, float dart_scale, Random& random);
    };

    struct SpineNoiseState {
        float phase = 0.0f;
        float speed = 0.35f;
        float pause = 0.0f;
        float value = 0.0f;

        void Advance(float dt, float t, Random& random);
    };

    struct IdleJoint {
        JointRole role;
        JointHandle* joint;
        glm::quat base;  // captured once per load, never written back
    };

    // Keyed relative rotations on one joint, eased with ease-out cubic.
    struct MotionSequence {
        struct Segment {
            glm::quat start;
            glm::quat end;
            float duration;
        };

        JointRole role = JointRole::Head;
        std::vector<Segment> segments;
        std::size_t index = 0;
        float elapsed = 0.0f;
        glm::quat current = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);

        bool Done() const { return index >= segments.size(); }
        void Advance(float dt);
    };

    // Produces per-joint offsets so the avatar breathes, sways and
    // gestures with drifting, never-repeating variation.
    class IdleMotionGenerator {
    public:
        static constexpr float kMotionScale = 0.2f;

        IdleMotionGenerator();
        explicit IdleMotionGenerator(uint32_t seed);

        // Binds joints by role and captures their base orientations. Only
        // the first call after Release() captures; missing joints are skipped.
        std::size_t CaptureJoints(CharacterRig& rig,
            const std::map<JointRole, std::string>& joint_names,
            const std::map<JointRole, float>& rest_roll_deg);
        void Release();

        void Advance(float dt);
        glm::vec3 OffsetFor(JointRole role) const;
        glm::quat RotationFor(JointRole role, const glm::quat& base) const;
        void Apply() const;

        glm::vec3 GetLookTarget() const;

        // Parameter controls.
        void SetStyleScales(float amp_scale, float freq_scale, float dart_scale);
        void SetBreathScale(float scale);
        void SetBlinkInterval(float min_sec, float max_sec);
        void TriggerBlink() { blink_.Trigger(); }
        void SetEyeDart(bool enabled, float darts_per_sec);
        void SetHeadBob(float amount, float tempo_bpm);
        void SetLean(const glm::vec3& lean);
        void SetPostureBias(JointRole role, const glm::vec3& bias);
        void ClearPostureBias();
        void SetPoseBias(JointRole role, const glm::vec3& bias);
        void ClearPoseBias();
        void SetGazeFocus(const glm::vec3& focus) { gaze_focus_target_ = focus; }
        void PlayLookAround(float duration_sec, float arc);
        void PlaySequence(JointRole role, const std::vector<glm::quat>& relative_rotations,
            const std::vector<float>& durations);

        const BlinkState& GetBlink() const { return blink_; }
        const HeadTiltState& GetTilt() const { return tilt_; }
        const GazeState& GetGaze() const { return gaze_; }
        const std::vector<IdleJoint>& GetJoints() const { return joints_; }
        float GetIdleTime() const { return idle_time_; }
        bool IsCaptured() const { return captured_; }
        bool IsLookingAround() const { return look_around_active_; }
        std::size_t GetActiveSequenceCount() const { return sequences_.size(); }

    private:
        void Init();
        void Retarget();

        Random random_;

        std::vector<IdleJoint> joints_;
        bool captured_ = false;

        float idle_time_ = 0.0f;
        Oscillator breathe_;
        Oscillator sway_;
        Oscillator nod_;
        Oscillator arm_;
        float amp_timer_ = 0.0f;

        BlinkState blink_;
        GazeState gaze_;
        HeadTiltState tilt_;
        SpineNoiseState spine_;

        float amp_scale_ = 1.0f;
        float freq_scale_ = 1.0f;
        float dart_scale_ = 1.0f;
        float breath_scale_ = 1.0f;

        float head_bob_amount_ = 0.0f;
        float head_bob_tempo_ = 100.0f;

        glm::vec3 lean_ = glm::vec3(0.0f);
        glm::vec3 lean_target_ = glm::vec3(0.0f);
        std::array<glm::vec3, kJointRoleCount> posture_bias_;
        std::array<glm::vec3, kJointRoleCount> pose_bias_;
        std::array<glm::vec3, kJointRoleCount> bias_;

        glm::vec3 gaze_focus_ = glm::vec3(0.0f, 1.35f, 0.6f);
        glm::vec3 gaze_focus_target_ = glm::vec3(0.0f, 1.35f, 0.6f);
        bool look_around_active_ = false;
        float look_around_elapsed_ = 0.0f;
        float look_around_duration_ = 0.0f;
        float look_around_arc_ = 0.0f;

        std::vector<MotionSequence> sequences_;
    };

}  // namespace AVATAR

#endif
