#include "AvatarController.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include <glm/gtc/quaternion.hpp>

namespace AVATAR {

    namespace {
        const glm::vec3 kAxisX(1.f, 0.f, 0.f);
        const glm::vec3 kAxisY(0.f, 1.f, 0.f);
        const glm::vec3 kAxisZ(0.f, 0.f, 1.f);

        glm::quat Deg(float degrees, const glm::vec3& axis) {
            return glm::angleAxis(glm::radians(degrees), axis);
        }

        float Clamp01(float v) {
            return std::max(0.0f, std::min(1.0f, v));
        }
    }  // namespace

    AvatarController::AvatarController(AvatarAnimator& animator, const std::string& avatar_id)
        : animator_(animator), avatar_id_(avatar_id) {
    }

    bool AvatarController::Accepts(const ToolCall& call) const {
        return call.avatar_id.empty() || call.avatar_id == avatar_id_;
    }

    ToolInvoker AvatarController::AsInvoker() {
        return [this](const ToolCall& call) { Apply(call); };
    }

    glm::vec3 AvatarController::GazePoint(const GazeTarget& target) {
        switch (target.kind) {
        case GazeKind::User:           return glm::vec3(0.0f, 1.35f, 0.6f);
        case GazeKind::Screen:         return glm::vec3(0.0f, 1.15f, 0.6f);
        case GazeKind::OffscreenLeft:  return glm::vec3(-0.9f, 1.35f, 0.6f);
        case GazeKind::OffscreenRight: return glm::vec3(0.9f, 1.35f, 0.6f);
        case GazeKind::Point:          return glm::vec3(target.x, target.y, target.z);
        }
        return glm::vec3(0.0f, 1.35f, 0.6f);
    }

    void AvatarController::Apply(const ToolCall& call) {
        if (!Accepts(call)) {
            std::cout << "[Controller] " << ToString(call.type) << " targets avatar "
                << call.avatar_id << ", not " << avatar_id_ << "\n";
            ++state_.ignored;
            return;
        }
        if (animator_.IsDisposed()) {
            ++state_.ignored;
            return;
        }

        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        const ToolPayload& p = call.payload;

        switch (call.type) {
        case ToolCallType::SetPose:
            ApplyPose(p.pose);
            break;
        case ToolCallType::SetGaze:
            state_.gaze = p.gaze;
            idle.SetGazeFocus(GazePoint(p.gaze));
            break;
        case ToolCallType::SetExpression:
            animator_.PlayPreset(p.preset);
            break;
        case ToolCallType::SetBlinkRate:
            ApplyBlinkRate(p.blink_rate);
            break;
        case ToolCallType::SetBreath:
            state_.breath = p.breath;
            idle.SetBreathScale(p.breath == BreathLevel::Low ? 0.6f
                : p.breath == BreathLevel::High ? 1.6f : 1.0f);
            break;
        case ToolCallType::SetIdleStyle:
            ApplyIdleStyle(p.idle_style);
            break;
        case ToolCallType::SetHandGesture:
            state_.has_hand_gesture = true;
            state_.hand_gesture = p.hand_gesture;
            break;
        case ToolCallType::PlayEmote:
            PlayEmote(p.emote);
            break;
        case ToolCallType::SetLipSyncMode:
            animator_.SetLipSyncMode(p.lip_sync);
            break;
        case ToolCallType::SetVoiceReactiveness:
            animator_.SetVoiceReactiveness(p.level);
            break;
        case ToolCallType::SetLean:
            ApplyLean(p.lean);
            break;
        case ToolCallType::SetHairReactiveness:
            state_.hair_reactiveness = Clamp01(p.level);
            break;
        case ToolCallType::SetEyeDart:
            idle.SetEyeDart(p.eye_dart.enabled, p.eye_dart.has_rate ? p.eye_dart.rate : 0.0f);
            break;
        case ToolCallType::SetHeadBob:
            idle.SetHeadBob(p.head_bob.amount, p.head_bob.has_tempo ? p.head_bob.tempo : 0.0f);
            break;
        case ToolCallType::PlayLookAround:
            idle.PlayLookAround(p.look_around.duration_ms / 1000.0f,
                p.look_around.has_arc ? p.look_around.arc : 0.6f);
            break;
        case ToolCallType::SetProximityReact:
            state_.has_proximity = true;
            state_.proximity_distance = std::max(0.0f, p.distance);
            break;
        case ToolCallType::SetLightingMood:
            state_.has_lighting = true;
            state_.lighting = p.lighting;
            break;
        case ToolCallType::SetAvatarFocus:
            state_.focus = p.focus;
            break;
        case ToolCallType::SetPosture:
            ApplyPosture(p.posture);
            break;
        case ToolCallType::PlayBeatReaction:
            ++state_.beat_reactions;
            break;
        }
        ++state_.applied;
    }

    // -----------------------------------------------------------------------------
    // Style tables
    // -----------------------------------------------------------------------------
    void AvatarController::ApplyIdleStyle(IdleStyle style) {
        state_.idle_style = style;
        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        switch (style) {
        case IdleStyle::Calm:    idle.SetStyleScales(0.8f, 0.85f, 0.7f); break;
        case IdleStyle::Bouncy:  idle.SetStyleScales(1.6f, 1.3f, 1.0f); break;
        case IdleStyle::Focused: idle.SetStyleScales(0.6f, 0.9f, 0.4f); break;
        case IdleStyle::Fidgety: idle.SetStyleScales(1.3f, 1.5f, 2.0f); break;
        }
    }

    void AvatarController::ApplyPose(PoseName pose) {
        state_.pose = pose;
        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        idle.ClearPoseBias();

        switch (pose) {
        case PoseName::Idle:
            idle.SetStyleScales(1.0f, 1.0f, 1.0f);
            break;
        case PoseName::Listening:
            idle.SetStyleScales(0.8f, 0.9f, 0.6f);
            idle.SetPoseBias(JointRole::Head, glm::vec3(0.05f, 0.0f, 0.06f));
            break;
        case PoseName::Speaking:
            idle.SetStyleScales(1.2f, 1.1f, 1.0f);
            break;
        case PoseName::Thinking:
            idle.SetStyleScales(0.6f, 0.8f, 0.3f);
            idle.SetPoseBias(JointRole::Head, glm::vec3(-0.08f, 0.1f, 0.08f));
            break;
        case PoseName::Excited:
            idle.SetStyleScales(1.6f, 1.3f, 1.2f);
            idle.SetPoseBias(JointRole::Chest, glm::vec3(-0.04f, 0.0f, 0.0f));
            break;
        }
    }

    void AvatarController::ApplyBlinkRate(const BlinkRate& rate) {
        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        switch (rate.kind) {
        case BlinkRateKind::Calm:
            idle.SetBlinkInterval(2.5f, 5.5f);
            break;
        case BlinkRateKind::Fast:
            idle.SetBlinkInterval(0.8f, 1.8f);
            break;
        case BlinkRateKind::PerMinute: {
            float mean = 60.0f / std::max(rate.per_minute, 1.0f);
            idle.SetBlinkInterval(mean * 0.75f, mean * 1.25f);
            break;
        }
        }
    }

    void AvatarController::ApplyPosture(PostureStyle style) {
        state_.has_posture = true;
        state_.posture = style;
        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        idle.ClearPostureBias();

        switch (style) {
        case PostureStyle::Upright:
            idle.SetPostureBias(JointRole::Spine, glm::vec3(-0.03f, 0.0f, 0.0f));
            idle.SetPostureBias(JointRole::Neck, glm::vec3(-0.02f, 0.0f, 0.0f));
            break;
        case PostureStyle::Relaxed:
            idle.SetPostureBias(JointRole::Spine, glm::vec3(0.04f, 0.0f, 0.0f));
            idle.SetPostureBias(JointRole::Head, glm::vec3(0.0f, 0.0f, 0.03f));
            break;
        case PostureStyle::Hero:
            idle.SetPostureBias(JointRole::Chest, glm::vec3(-0.06f, 0.0f, 0.0f));
            idle.SetPostureBias(JointRole::Head, glm::vec3(-0.04f, 0.0f, 0.0f));
            break;
        case PostureStyle::Shy:
            idle.SetPostureBias(JointRole::Neck, glm::vec3(0.08f, 0.0f, 0.0f));
            idle.SetPostureBias(JointRole::Head, glm::vec3(0.06f, 0.0f, 0.05f));
            break;
        }
    }

    void AvatarController::ApplyLean(const LeanPayload& lean) {
        const float angle = std::max(-1.0f, std::min(1.0f, lean.amount)) * 0.15f;
        glm::vec3 v(0.0f);
        switch (lean.axis) {
        case LeanAxis::Forward: v.x = angle; break;
        case LeanAxis::Back:    v.x = -angle; break;
        case LeanAxis::Left:    v.z = angle; break;
        case LeanAxis::Right:   v.z = -angle; break;
        }
        animator_.GetIdleMotion().SetLean(v);
    }

    // -----------------------------------------------------------------------------
    // Emotes: keyed relative rotations, eased by the idle generator.
    // -----------------------------------------------------------------------------
    void AvatarController::PlayEmote(const EmotePayload& emote) {
        IdleMotionGenerator& idle = animator_.GetIdleMotion();
        const float k = emote.has_intensity ? std::max(0.0f, std::min(2.0f, emote.intensity)) : 1.0f;

        switch (emote.emote) {
        case EmoteName::Nod:
            idle.PlaySequence(JointRole::Head,
                { Deg(-20.0f * k, kAxisX), Deg(20.0f * k, kAxisX) },
                { 0.35f, 0.35f });
            break;
        case EmoteName::HeadShake:
            idle.PlaySequence(JointRole::Head,
                { Deg(20.0f * k, kAxisY), Deg(-40.0f * k, kAxisY), Deg(20.0f * k, kAxisY) },
                { 0.25f, 0.3f, 0.25f });
            break;
        case EmoteName::HeadTilt:
            idle.PlaySequence(JointRole::Head, { Deg(12.0f * k, kAxisZ) }, { 0.4f });
            break;
        case EmoteName::Shrug:
            idle.PlaySequence(JointRole::Head, { Deg(8.0f * k, kAxisZ) }, { 0.3f });
            idle.PlaySequence(JointRole::Chest, { Deg(-4.0f * k, kAxisX) }, { 0.3f });
            break;
        case EmoteName::Bow:
            idle.PlaySequence(JointRole::Spine, { Deg(15.0f * k, kAxisX) }, { 0.6f });
            idle.PlaySequence(JointRole::Chest, { Deg(10.0f * k, kAxisX) }, { 0.6f });
            idle.PlaySequence(JointRole::Head, { Deg(10.0f * k, kAxisX) }, { 0.6f });
            break;
        case EmoteName::FistPump:
            idle.PlaySequence(JointRole::Chest, { Deg(-6.0f * k, kAxisX) }, { 0.2f });
            idle.PlaySequence(JointRole::Head,
                { Deg(-10.0f * k, kAxisX), Deg(10.0f * k, kAxisX) },
                { 0.2f, 0.2f });
            break;
        }
    }

}  // namespace AVATAR
