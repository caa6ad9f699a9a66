#include "IdleMotion.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <glm/gtc/constants.hpp>

namespace AVATAR {

    constexpr float BlinkState::kCloseSeconds;
    constexpr float BlinkState::kOpenSeconds;
    constexpr float HeadTiltState::kMaxAngle;
    constexpr float IdleMotionGenerator::kMotionScale;

    namespace {
        const char* const kRoleNames[kJointRoleCount] = {
            "spine",
            "chest",
            "neck",
            "head",
            "leftShoulder",
            "rightShoulder",
            "leftUpperArm",
            "rightUpperArm",
            "leftLowerArm",
            "rightLowerArm"
        };

        std::size_t Index(JointRole role) {
            return static_cast<std::size_t>(role);
        }

        // Amplitude/frequency drift.
        const float kAmpLambda = 1.5f;
        const float kFreqLambda = 1.2f;
        const float kBiasLambda = 3.0f;
        const float kFocusLambda = 4.0f;
    }  // namespace

    const char* ToString(JointRole role) {
        std::size_t i = Index(role);
        return i < kJointRoleCount ? kRoleNames[i] : "unknown";
    }

    bool JointRoleFromString(const std::string& name, JointRole& role) {
        for (std::size_t i = 0; i < kJointRoleCount; ++i) {
            if (name == kRoleNames[i]) {
                role = static_cast<JointRole>(i);
                return true;
            }
        }
        return false;
    }

    glm::quat EulerXYZ(const glm::vec3& radians) {
        glm::quat qx = glm::angleAxis(radians.x, glm::vec3(1.f, 0.f, 0.f));
        glm::quat qy = glm::angleAxis(radians.y, glm::vec3(0.f, 1.f, 0.f));
        glm::quat qz = glm::angleAxis(radians.z, glm::vec3(0.f, 0.f, 1.f));
        return qx * qy * qz;
    }

    float ExpDamp(float current, float target, float lambda, float dt) {
        float t = 1.0f - std::exp(-lambda * dt);
        return current + (target - current) * t;
    }

    void DampedValue::Damp(float lambda, float dt) {
        current += (target - current) * std::min(1.0f, lambda * dt);
    }

    float Oscillator::Sample(float t) const {
        return std::sin(t * freq.current) * amp.current;
    }

    // -----------------------------------------------------------------------------
    // Blink: Open -> Closing (80 ms) -> Opening (120 ms) -> Open.
    // -----------------------------------------------------------------------------
    void BlinkState::Advance(float dt, Random& random) {
        timer -= dt;
        if (timer <= 0.0f) {
            phase = BlinkPhase::Closing;
            timer = random.Uniform(min_interval, max_interval);
        }

        if (phase == BlinkPhase::Closing) {
            value += dt / kCloseSeconds;
            if (value >= 1.0f) {
                value = 1.0f;
                phase = BlinkPhase::Opening;
            }
        }
        else if (phase == BlinkPhase::Opening) {
            value -= dt / kOpenSeconds;
            if (value <= 0.0f) {
                value = 0.0f;
                phase = BlinkPhase::Open;
            }
        }
    }

    // -----------------------------------------------------------------------------
    // Head tilt bursts: damped approach to a small roll, then damped return.
    // -----------------------------------------------------------------------------
    void HeadTiltState::Advance(float dt, Random& random) {
        timer -= dt;
        if (timer <= 0.0f) {
            phase = TiltPhase::MovingToTarget;
            target = random.Symmetric(kMaxAngle);
            timer = random.Uniform(7.0f, 13.0f);
        }

        if (phase == TiltPhase::MovingToTarget) {
            value = ExpDamp(value, target, 8.0f, dt);
            if (std::abs(value - target) < 0.003f) {
                phase = TiltPhase::Returning;
            }
        }
        else if (phase == TiltPhase::Returning) {
            value = ExpDamp(value, 0.0f, 6.0f, dt);
            if (std::abs(value) < 0.001f) {
                phase = TiltPhase::Idle;
                value = 0.0f;
            }
        }
    }

    // -----------------------------------------------------------------------------
    // Gaze micro-darts: jump to a random offset, then decay back to centre.
    // -----------------------------------------------------------------------------
    void GazeState::Advance(float dt, float dart_scale, Random& random) {
        timer -= dt;
        if (timer <= 0.0f) {
            if (enabled) {
                offset.x = random.Symmetric(0.12f);
                offset.y = random.Symmetric(0.1f);
            }
            float scale = std::max(dart_scale, 0.05f);
            timer = random.Uniform(min_interval, max_interval) / scale;
        }
        float decay = std::pow(0.92f, dt * 60.0f);
        offset *= decay;
    }

    void SpineNoiseState::Advance(float dt, float t, Random& random) {
        pause -= dt;
        if (pause <= 0.0f) {
            phase = random.Uniform(0.0f, glm::two_pi<float>());
            pause = random.Uniform(2.5f, 6.0f);
            speed = random.Uniform(0.25f, 0.55f);
        }
        value = std::sin(t * speed + phase) * 0.015f;
    }

    // -----------------------------------------------------------------------------
    // Keyed sequences (nods, shakes, bows...).
    // -----------------------------------------------------------------------------
    void MotionSequence::Advance(float dt) {
        while (!Done()) {
            const Segment& seg = segments[index];
            elapsed += dt;
            dt = 0.0f;

            float t = elapsed / seg.duration;
            if (t >= 1.0f) {
                current = seg.end;
                dt = elapsed - seg.duration;
                elapsed = 0.0f;
                ++index;
                if (dt <= 0.0f) {
                    return;
                }
                continue;
            }

            float eased_t = 1.0f - std::pow(1.0f - t, 3.0f);  // ease-out cubic
            current = glm::slerp(seg.start, seg.end, eased_t);
            return;
        }
    }

    // -----------------------------------------------------------------------------
    // Generator
    // -----------------------------------------------------------------------------
    IdleMotionGenerator::IdleMotionGenerator() {
        Init();
    }

    IdleMotionGenerator::IdleMotionGenerator(uint32_t seed)
        : random_(seed) {
        Init();
    }

    void IdleMotionGenerator::Init() {
        breathe_.amp.current = breathe_.amp.target = 0.014f;
        sway_.amp.current = sway_.amp.target = 0.05f;
        nod_.amp.current = nod_.amp.target = 0.025f;
        arm_.amp.current = arm_.amp.target = 0.03f;
        breathe_.freq.current = breathe_.freq.target = 1.0f;
        sway_.freq.current = sway_.freq.target = 0.85f;
        nod_.freq.current = nod_.freq.target = 1.2f;
        arm_.freq.current = arm_.freq.target = 0.95f;

        blink_.timer = random_.Uniform(2.5f, 5.5f);
        gaze_.timer = random_.Uniform(1.5f, 3.0f);
        amp_timer_ = random_.Uniform(8.0f, 14.0f);
        tilt_.timer = random_.Uniform(6.0f, 12.0f);
        spine_.speed = random_.Uniform(0.35f, 0.55f);
        spine_.phase = random_.Uniform(0.0f, glm::two_pi<float>());
        spine_.pause = random_.Uniform(2.5f, 6.0f);

        posture_bias_.fill(glm::vec3(0.0f));
        pose_bias_.fill(glm::vec3(0.0f));
        bias_.fill(glm::vec3(0.0f));
    }

    std::size_t IdleMotionGenerator::CaptureJoints(CharacterRig& rig,
        const std::map<JointRole, std::string>& joint_names,
        const std::map<JointRole, float>& rest_roll_deg) {
        if (captured_) {
            std::cerr << "[IdleMotion] WARNING: joints already captured for this load\n";
            return joints_.size();
        }

        joints_.clear();
        const glm::vec3 axis_z(0.f, 0.f, 1.f);
        for (const auto& kv : joint_names) {
            JointHandle* joint = rig.FindJoint(kv.second);
            if (joint == nullptr) {
                continue;
            }

            glm::quat base = joint->GetRotation();
            auto roll = rest_roll_deg.find(kv.first);
            if (roll != rest_roll_deg.end()) {
                base = glm::angleAxis(glm::radians(roll->second), axis_z) * base;
            }
            joints_.push_back(IdleJoint{ kv.first, joint, base });
        }

        captured_ = true;
        std::cout << "[IdleMotion] captured " << joints_.size() << " of "
            << joint_names.size() << " idle joints\n";
        return joints_.size();
    }

    void IdleMotionGenerator::Release() {
        joints_.clear();
        sequences_.clear();
        captured_ = false;
    }

    void IdleMotionGenerator::Retarget() {
        const float amp = amp_scale_;
        const float freq = freq_scale_;
        breathe_.amp.target = random_.Uniform(0.012f, 0.022f) * amp * breath_scale_;
        sway_.amp.target = random_.Uniform(0.045f, 0.075f) * amp;
        nod_.amp.target = random_.Uniform(0.02f, 0.04f) * amp;
        arm_.amp.target = random_.Uniform(0.025f, 0.045f) * amp;
        breathe_.freq.target = random_.Uniform(0.85f, 1.2f) * freq;
        sway_.freq.target = random_.Uniform(0.7f, 1.1f) * freq;
        nod_.freq.target = random_.Uniform(1.0f, 1.4f) * freq;
        arm_.freq.target = random_.Uniform(0.8f, 1.15f) * freq;
    }

    void IdleMotionGenerator::Advance(float dt) {
        if (dt <= 0.0f) {
            return;
        }
        idle_time_ += dt;

        blink_.Advance(dt, random_);
        gaze_.Advance(dt, dart_scale_, random_);

        amp_timer_ -= dt;
        if (amp_timer_ <= 0.0f) {
            Retarget();
            amp_timer_ = random_.Uniform(8.0f, 14.0f);
        }
        spine_.Advance(dt, idle_time_, random_);

        breathe_.amp.Damp(kAmpLambda, dt);
        sway_.amp.Damp(kAmpLambda, dt);
        nod_.amp.Damp(kAmpLambda, dt);
        arm_.amp.Damp(kAmpLambda, dt);
        breathe_.freq.Damp(kFreqLambda, dt);
        sway_.freq.Damp(kFreqLambda, dt);
        nod_.freq.Damp(kFreqLambda, dt);
        arm_.freq.Damp(kFreqLambda, dt);

        tilt_.Advance(dt, random_);

        for (int axis = 0; axis < 3; ++axis) {
            lean_[axis] = ExpDamp(lean_[axis], lean_target_[axis], kBiasLambda, dt);
            gaze_focus_[axis] = ExpDamp(gaze_focus_[axis], gaze_focus_target_[axis],
                kFocusLambda, dt);
        }
        for (std::size_t i = 0; i < kJointRoleCount; ++i) {
            glm::vec3 target = posture_bias_[i] + pose_bias_[i];
            for (int axis = 0; axis < 3; ++axis) {
                bias_[i][axis] = ExpDamp(bias_[i][axis], target[axis], kBiasLambda, dt);
            }
        }

        if (look_around_active_) {
            look_around_elapsed_ += dt;
            if (look_around_elapsed_ >= look_around_duration_) {
                look_around_active_ = false;
            }
        }

        for (MotionSequence& seq : sequences_) {
            seq.Advance(dt);
        }
        sequences_.erase(std::remove_if(sequences_.begin(), sequences_.end(),
            [](const MotionSequence& s) { return s.Done(); }), sequences_.end());
    }

    glm::vec3 IdleMotionGenerator::OffsetFor(JointRole role) const {
        const float t = idle_time_;
        const float breathe = breathe_.Sample(t) * kMotionScale;
        const float sway = sway_.Sample(t) * kMotionScale + spine_.value;
        const float nod = nod_.Sample(t) * kMotionScale;
        const float arm_wave = arm_.Sample(t) * kMotionScale;

        glm::vec3 euler(0.0f);
        switch (role) {
        case JointRole::Spine:
        case JointRole::Chest:
            euler.x += breathe;
            euler.y += sway * 0.25f;
            euler += lean_ * 0.5f;
            break;
        case JointRole::Neck:
        case JointRole::Head:
            euler.x += nod * 0.6f;
            euler.y += sway * 0.6f;
            euler.z += tilt_.value;
            if (role == JointRole::Head && head_bob_amount_ > 0.0f) {
                float beat_hz = head_bob_tempo_ / 60.0f;
                euler.x += std::sin(t * glm::two_pi<float>() * beat_hz) * head_bob_amount_ * 0.05f;
            }
            break;
        case JointRole::LeftUpperArm:
            euler.z += arm_wave * 0.5f;
            euler.x += breathe * 0.5f;
            break;
        case JointRole::RightUpperArm:
            euler.z -= arm_wave * 0.5f;
            euler.x += breathe * 0.5f;
            break;
        default:
            break;
        }

        std::size_t i = Index(role);
        if (i < kJointRoleCount) {
            euler += bias_[i];
        }
        return euler;
    }

    glm::quat IdleMotionGenerator::RotationFor(JointRole role, const glm::quat& base) const {
        // Base first, offset second: offsets live in the joint's local frame.
        glm::quat q = base * EulerXYZ(OffsetFor(role));
        for (const MotionSequence& seq : sequences_) {
            if (seq.role == role) {
                q = q * seq.current;
            }
        }
        return q;
    }

    void IdleMotionGenerator::Apply() const {
        for (const IdleJoint& j : joints_) {
            j.joint->SetRotation(RotationFor(j.role, j.base));
        }
    }

    glm::vec3 IdleMotionGenerator::GetLookTarget() const {
        glm::vec3 target = gaze_focus_;
        target.x += gaze_.offset.x * 0.5f;
        target.y += gaze_.offset.y * 0.35f;
        if (look_around_active_ && look_around_duration_ > 0.0f) {
            float p = look_around_elapsed_ / look_around_duration_;
            target.x += std::sin(p * glm::two_pi<float>()) * look_around_arc_ * 0.5f;
        }
        return target;
    }

    // -----------------------------------------------------------------------------
    // Parameter controls
    // -----------------------------------------------------------------------------
    void IdleMotionGenerator::SetStyleScales(float amp_scale, float freq_scale, float dart_scale) {
        amp_scale_ = std::max(amp_scale, 0.0f);
        freq_scale_ = std::max(freq_scale, 0.0f);
        dart_scale_ = std::max(dart_scale, 0.0f);
        Retarget();
        amp_timer_ = random_.Uniform(8.0f, 14.0f);
    }

    void IdleMotionGenerator::SetBreathScale(float scale) {
        breath_scale_ = std::max(scale, 0.0f);
        breathe_.amp.target = random_.Uniform(0.012f, 0.022f) * amp_scale_ * breath_scale_;
    }

    void IdleMotionGenerator::SetBlinkInterval(float min_sec, float max_sec) {
        min_sec = std::max(min_sec, 0.05f);
        max_sec = std::max(max_sec, min_sec);
        blink_.min_interval = min_sec;
        blink_.max_interval = max_sec;
        if (blink_.timer > max_sec) {
            blink_.timer = random_.Uniform(min_sec, max_sec);
        }
    }

    void IdleMotionGenerator::SetEyeDart(bool enabled, float darts_per_sec) {
        gaze_.enabled = enabled;
        if (darts_per_sec > 0.0f) {
            float mean = 1.0f / darts_per_sec;
            gaze_.min_interval = mean * 0.75f;
            gaze_.max_interval = mean * 1.25f;
            gaze_.timer = std::min(gaze_.timer, gaze_.max_interval);
        }
    }

    void IdleMotionGenerator::SetHeadBob(float amount, float tempo_bpm) {
        head_bob_amount_ = std::min(std::max(amount, 0.0f), 1.0f);
        if (tempo_bpm > 0.0f) {
            head_bob_tempo_ = tempo_bpm;
        }
    }

    void IdleMotionGenerator::SetLean(const glm::vec3& lean) {
        lean_target_ = lean;
    }

    void IdleMotionGenerator::SetPostureBias(JointRole role, const glm::vec3& bias) {
        std::size_t i = Index(role);
        if (i < kJointRoleCount) {
            posture_bias_[i] = bias;
        }
    }

    void IdleMotionGenerator::ClearPostureBias() {
        posture_bias_.fill(glm::vec3(0.0f));
    }

    void IdleMotionGenerator::SetPoseBias(JointRole role, const glm::vec3& bias) {
        std::size_t i = Index(role);
        if (i < kJointRoleCount) {
            pose_bias_[i] = bias;
        }
    }

    void IdleMotionGenerator::ClearPoseBias() {
        pose_bias_.fill(glm::vec3(0.0f));
    }

    void IdleMotionGenerator::PlayLookAround(float duration_sec, float arc) {
        if (duration_sec <= 0.0f) {
            return;
        }
        look_around_active_ = true;
        look_around_elapsed_ = 0.0f;
        look_around_duration_ = duration_sec;
        look_around_arc_ = arc;
    }

    void IdleMotionGenerator::PlaySequence(JointRole role,
        const std::vector<glm::quat>& relative_rotations,
        const std::vector<float>& durations) {
        if (relative_rotations.empty() || durations.empty()) {
            return;
        }

        // Start from wherever a running sequence on this joint has got to.
        glm::quat current_abs(1.0f, 0.0f, 0.0f, 0.0f);
        for (auto it = sequences_.begin(); it != sequences_.end();) {
            if (it->role == role) {
                current_abs = it->current;
                it = sequences_.erase(it);
            }
            else {
                ++it;
            }
        }

        MotionSequence seq;
        seq.role = role;
        seq.current = current_abs;
        for (std::size_t i = 0; i < relative_rotations.size(); ++i) {
            float dur = (i < durations.size() ? durations[i] : durations.back());
            dur = std::max(dur, 0.001f);

            MotionSequence::Segment seg;
            seg.start = current_abs;
            seg.end = current_abs * relative_rotations[i];
            seg.duration = dur;
            seq.segments.push_back(seg);
            current_abs = seg.end;
        }

        // Never leave the joint parked off its idle pose.
        const glm::quat identity(1.0f, 0.0f, 0.0f, 0.0f);
        if (std::abs(glm::dot(current_abs, identity)) < 0.9999f) {
            MotionSequence::Segment back;
            back.start = current_abs;
            back.end = identity;
            back.duration = 0.35f;
            seq.segments.push_back(back);
        }

        sequences_.push_back(seq);
    }

}  // namespace AVATAR
