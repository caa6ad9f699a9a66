#ifndef AVATAR_CONTROLLER_H_
#define AVATAR_CONTROLLER_H_

#include <string>

#include <glm/glm.hpp>

#include "AvatarAnimator.hpp"
#include "CommandBus.hpp"
#include "ToolCall.hpp"

namespace AVATAR {

    // Last value of every command, including the ones with no joint to drive.
    struct ControllerState {
        PoseName pose = PoseName::Idle;
        IdleStyle idle_style = IdleStyle::Calm;
        BreathLevel breath = BreathLevel::Med;
        bool has_posture = false;
        PostureStyle posture = PostureStyle::Upright;
        GazeTarget gaze = GazeTarget{ GazeKind::User, 0.0f, 0.0f, 0.0f };
        bool has_hand_gesture = false;
        HandGesturePayload hand_gesture = HandGesturePayload{ HandGesture::Open, Hand::Both };
        float hair_reactiveness = 0.5f;
        bool has_proximity = false;
        float proximity_distance = 0.0f;
        bool has_lighting = false;
        LightingMood lighting = LightingMood::Warm;
        FocusTarget focus = FocusTarget::Self;
        unsigned long beat_reactions = 0;

        unsigned long applied = 0;
        unsigned long ignored = 0;
    };

    // Production command sink: turns commands into animation parameter
    // changes on one avatar.
    class AvatarController {
    public:
        AvatarController(AvatarAnimator& animator, const std::string& avatar_id);

        // Commands addressed to another avatar are ignored.
        bool Accepts(const ToolCall& call) const;
        void Apply(const ToolCall& call);

        // Sink for CommandBus. The controller must outlive the bus binding.
        ToolInvoker AsInvoker();

        const ControllerState& GetState() const { return state_; }
        const std::string& GetAvatarId() const { return avatar_id_; }

        static glm::vec3 GazePoint(const GazeTarget& target);

    private:
        void ApplyPose(PoseName pose);
        void ApplyIdleStyle(IdleStyle style);
        void ApplyBlinkRate(const BlinkRate& rate);
        void ApplyPosture(PostureStyle style);
        void ApplyLean(const LeanPayload& lean);
        void PlayEmote(const EmotePayload& emote);

        AvatarAnimator& animator_;
        std::string avatar_id_;
        ControllerState state_;
    };

}  // namespace AVATAR

#endif
