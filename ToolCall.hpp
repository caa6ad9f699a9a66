#ifndef TOOL_CALL_H_
#define TOOL_CALL_H_

#include <string>

#include <nlohmann/json.hpp>

namespace AVATAR {

    enum class ToolCallType {
        SetPose,
        SetGaze,
        SetExpression,
        SetBlinkRate,
        SetBreath,
        SetIdleStyle,
        SetHandGesture,
        PlayEmote,
        SetLipSyncMode,
        SetVoiceReactiveness,
        SetLean,
        SetHairReactiveness,
        SetEyeDart,
        SetHeadBob,
        PlayLookAround,
        SetProximityReact,
        SetLightingMood,
        SetAvatarFocus,
        SetPosture,
        PlayBeatReaction
    };

    enum class PoseName { Idle, Listening, Speaking, Thinking, Excited };
    enum class GazeKind { User, Screen, OffscreenLeft, OffscreenRight, Point };
    enum class ExpressionPreset { Smile, Surprised, Concerned, Wink, Laugh, Blink };
    enum class BlinkRateKind { Calm, Fast, PerMinute };
    enum class BreathLevel { Low, Med, High };
    enum class IdleStyle { Calm, Bouncy, Focused, Fidgety };
    enum class Hand { Left, Right, Both };
    enum class HandGesture { Wave, Point, ThumbsUp, Open, Closed };
    enum class EmoteName { Nod, Shrug, HeadTilt, HeadShake, Bow, FistPump };
    enum class LipSyncMode { Live, Muted, Exaggerated };
    enum class LeanAxis { Forward, Back, Left, Right };
    enum class LightingMood { Warm, Cool, Dramatic };
    enum class FocusTarget { Self, Peer };
    enum class PostureStyle { Upright, Relaxed, Hero, Shy };

    struct GazeTarget {
        GazeKind kind;
        float x, y, z;  // only for GazeKind::Point
    };

    struct BlinkRate {
        BlinkRateKind kind;
        float per_minute;  // only for BlinkRateKind::PerMinute
    };

    struct HandGesturePayload {
        HandGesture gesture;
        Hand hand;
    };

    struct EmotePayload {
        EmoteName emote;
        bool has_intensity;
        float intensity;
    };

    struct LeanPayload {
        float amount;
        LeanAxis axis;
    };

    struct EyeDartPayload {
        bool enabled;
        bool has_rate;
        float rate;
    };

    struct HeadBobPayload {
        float amount;
        bool has_tempo;
        float tempo;
    };

    struct LookAroundPayload {
        float duration_ms;
        bool has_arc;
        float arc;
    };

    // Payload storage; `ToolCall::type` says which member is live.
    union ToolPayload {
        PoseName pose;
        GazeTarget gaze;
        ExpressionPreset preset;
        BlinkRate blink_rate;
        BreathLevel breath;
        IdleStyle idle_style;
        HandGesturePayload hand_gesture;
        EmotePayload emote;
        LipSyncMode lip_sync;
        float level;  // voice reactiveness, hair reactiveness
        LeanPayload lean;
        EyeDartPayload eye_dart;
        HeadBobPayload head_bob;
        LookAroundPayload look_around;
        float distance;
        LightingMood lighting;
        FocusTarget focus;
        PostureStyle posture;

        ToolPayload() : look_around{ 0.0f, false, 0.0f } {}
    };

    // One avatar animation command. Built once, then passed by const ref.
    struct ToolCall {
        ToolCallType type = ToolCallType::PlayBeatReaction;
        ToolPayload payload;
        std::string avatar_id;  // empty: any avatar

        static ToolCall MakeSetPose(PoseName pose, const std::string& avatar_id = "");
        static ToolCall MakeSetExpression(ExpressionPreset preset, const std::string& avatar_id = "");
        static ToolCall MakeSetGaze(GazeKind kind, const std::string& avatar_id = "");
        static ToolCall MakePlayEmote(EmoteName emote, const std::string& avatar_id = "");
    };

    bool operator==(const ToolCall& a, const ToolCall& b);
    inline bool operator!=(const ToolCall& a, const ToolCall& b) { return !(a == b); }

    const char* ToString(ToolCallType type);
    const char* ToString(ExpressionPreset preset);

    nlohmann::json ToJson(const ToolCall& call);

    struct ParseError {
        std::string message;
    };

    // Result of parsing one untrusted JSON object into a ToolCall.
    class ToolCallParseResult {
    public:
        static ToolCallParseResult Ok(const ToolCall& call);
        static ToolCallParseResult Fail(const std::string& message);

        bool IsOk() const { return ok_; }
        const ToolCall& Value() const { return call_; }
        const ParseError& Error() const { return error_; }

    private:
        bool ok_ = false;
        ToolCall call_;
        ParseError error_;
    };

    ToolCallParseResult TryParseToolCall(const nlohmann::json& j);

}  // namespace AVATAR

#endif
