#include "ToolCall.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace AVATAR {

    using json = nlohmann::json;

    namespace {

        template <typename E, std::size_t N>
        bool FromName(const std::pair<const char*, E>(&table)[N], const std::string& name, E& out) {
            for (std::size_t i = 0; i < N; ++i) {
                if (name == table[i].first) {
                    out = table[i].second;
                    return true;
                }
            }
            return false;
        }

        template <typename E, std::size_t N>
        const char* ToName(const std::pair<const char*, E>(&table)[N], E value) {
            for (std::size_t i = 0; i < N; ++i) {
                if (table[i].second == value) {
                    return table[i].first;
                }
            }
            return "";
        }

        const std::pair<const char*, ToolCallType> kTypeNames[] = {
            { "setPose", ToolCallType::SetPose },
            { "setGaze", ToolCallType::SetGaze },
            { "setExpression", ToolCallType::SetExpression },
            { "setBlinkRate", ToolCallType::SetBlinkRate },
            { "setBreath", ToolCallType::SetBreath },
            { "setIdleStyle", ToolCallType::SetIdleStyle },
            { "setHandGesture", ToolCallType::SetHandGesture },
            { "playEmote", ToolCallType::PlayEmote },
            { "setLipSyncMode", ToolCallType::SetLipSyncMode },
            { "setVoiceReactiveness", ToolCallType::SetVoiceReactiveness },
            { "setLean", ToolCallType::SetLean },
            { "setHairReactiveness", ToolCallType::SetHairReactiveness },
            { "setEyeDart", ToolCallType::SetEyeDart },
            { "setHeadBob", ToolCallType::SetHeadBob },
            { "playLookAround", ToolCallType::PlayLookAround },
            { "setProximityReact", ToolCallType::SetProximityReact },
            { "setLightingMood", ToolCallType::SetLightingMood },
            { "setAvatarFocus", ToolCallType::SetAvatarFocus },
            { "setPosture", ToolCallType::SetPosture },
            { "playBeatReaction", ToolCallType::PlayBeatReaction },
        };

        const std::pair<const char*, PoseName> kPoseNames[] = {
            { "idle", PoseName::Idle },
            { "listening", PoseName::Listening },
            { "speaking", PoseName::Speaking },
            { "thinking", PoseName::Thinking },
            { "excited", PoseName::Excited },
        };

        const std::pair<const char*, GazeKind> kGazeNames[] = {
            { "user", GazeKind::User },
            { "screen", GazeKind::Screen },
            { "offscreen-left", GazeKind::OffscreenLeft },
            { "offscreen-right", GazeKind::OffscreenRight },
        };

        const std::pair<const char*, ExpressionPreset> kPresetNames[] = {
            { "smile", ExpressionPreset::Smile },
            { "surprised", ExpressionPreset::Surprised },
            { "concerned", ExpressionPreset::Concerned },
            { "wink", ExpressionPreset::Wink },
            { "laugh", ExpressionPreset::Laugh },
            { "blink", ExpressionPreset::Blink },
        };

        // Loose words the agent tends to use instead of a preset name.
        const std::pair<const char*, ExpressionPreset> kPresetSynonyms[] = {
            { "happy", ExpressionPreset::Smile },
            { "serious", ExpressionPreset::Concerned },
            { "sad", ExpressionPreset::Concerned },
            { "frown", ExpressionPreset::Concerned },
            { "winking", ExpressionPreset::Wink },
        };

        const std::pair<const char*, BlinkRateKind> kBlinkRateNames[] = {
            { "calm", BlinkRateKind::Calm },
            { "fast", BlinkRateKind::Fast },
        };

        const std::pair<const char*, BreathLevel> kBreathNames[] = {
            { "low", BreathLevel::Low },
            { "med", BreathLevel::Med },
            { "high", BreathLevel::High },
        };

        const std::pair<const char*, IdleStyle> kIdleStyleNames[] = {
            { "calm", IdleStyle::Calm },
            { "bouncy", IdleStyle::Bouncy },
            { "focused", IdleStyle::Focused },
            { "fidgety", IdleStyle::Fidgety },
        };

        const std::pair<const char*, Hand> kHandNames[] = {
            { "left", Hand::Left },
            { "right", Hand::Right },
            { "both", Hand::Both },
        };

        const std::pair<const char*, HandGesture> kGestureNames[] = {
            { "wave", HandGesture::Wave },
            { "point", HandGesture::Point },
            { "thumbs-up", HandGesture::ThumbsUp },
            { "open", HandGesture::Open },
            { "closed", HandGesture::Closed },
        };

        const std::pair<const char*, EmoteName> kEmoteNames[] = {
            { "nod", EmoteName::Nod },
            { "shrug", EmoteName::Shrug },
            { "head-tilt", EmoteName::HeadTilt },
            { "head-shake", EmoteName::HeadShake },
            { "bow", EmoteName::Bow },
            { "fist-pump", EmoteName::FistPump },
        };

        const std::pair<const char*, LipSyncMode> kLipSyncNames[] = {
            { "live", LipSyncMode::Live },
            { "muted", LipSyncMode::Muted },
            { "exaggerated", LipSyncMode::Exaggerated },
        };

        const std::pair<const char*, LeanAxis> kLeanAxisNames[] = {
            { "forward", LeanAxis::Forward },
            { "back", LeanAxis::Back },
            { "left", LeanAxis::Left },
            { "right", LeanAxis::Right },
        };

        const std::pair<const char*, LightingMood> kMoodNames[] = {
            { "warm", LightingMood::Warm },
            { "cool", LightingMood::Cool },
            { "dramatic", LightingMood::Dramatic },
        };

        const std::pair<const char*, FocusTarget> kFocusNames[] = {
            { "self", FocusTarget::Self },
            { "peer", FocusTarget::Peer },
        };

        const std::pair<const char*, PostureStyle> kPostureNames[] = {
            { "upright", PostureStyle::Upright },
            { "relaxed", PostureStyle::Relaxed },
            { "hero", PostureStyle::Hero },
            { "shy", PostureStyle::Shy },
        };

        // -------------------------------------------------------------------------
        // Field readers: explicit type checks, no exceptions.
        // -------------------------------------------------------------------------
        bool ReadString(const json& j, const char* key, std::string& out) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string()) {
                return false;
            }
            out = it->get<std::string>();
            return true;
        }

        bool ReadNumber(const json& j, const char* key, float& out) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_number()) {
                return false;
            }
            out = it->get<float>();
            return std::isfinite(out);
        }

        bool ReadBool(const json& j, const char* key, bool& out) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_boolean()) {
                return false;
            }
            out = it->get<bool>();
            return true;
        }

        template <typename E, std::size_t N>
        bool ReadEnum(const json& j, const char* key,
            const std::pair<const char*, E>(&table)[N], E& out, std::string& error) {
            std::string name;
            if (!ReadString(j, key, name)) {
                error = std::string("missing or non-string field '") + key + "'";
                return false;
            }
            if (!FromName(table, name, out)) {
                error = std::string("unsupported ") + key + " '" + name + "'";
                return false;
            }
            return true;
        }

        bool RequireNumber(const json& j, const char* key, float& out, std::string& error) {
            if (!ReadNumber(j, key, out)) {
                error = std::string("missing or non-numeric field '") + key + "'";
                return false;
            }
            return true;
        }

        std::string ToLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool ReadPreset(const json& j, ExpressionPreset& out, std::string& error) {
            std::string raw;
            if (!ReadString(j, "preset", raw) && !ReadString(j, "expression", raw)) {
                auto ctx = j.find("context");
                if (ctx == j.end() || !ctx->is_object() ||
                    (!ReadString(*ctx, "preset", raw) && !ReadString(*ctx, "expression", raw))) {
                    error = "missing preset for setExpression";
                    return false;
                }
            }

            std::string name = ToLower(raw);
            if (FromName(kPresetNames, name, out) || FromName(kPresetSynonyms, name, out)) {
                return true;
            }
            error = "unsupported preset '" + name + "'";
            return false;
        }

        bool ReadGaze(const json& j, GazeTarget& out, std::string& error) {
            auto it = j.find("target");
            if (it == j.end()) {
                error = "missing field 'target'";
                return false;
            }
            out.x = out.y = out.z = 0.0f;
            if (it->is_string()) {
                if (!FromName(kGazeNames, it->get<std::string>(), out.kind)) {
                    error = "unsupported gaze target '" + it->get<std::string>() + "'";
                    return false;
                }
                return true;
            }
            if (it->is_object()) {
                if (!ReadNumber(*it, "x", out.x) || !ReadNumber(*it, "y", out.y) ||
                    !ReadNumber(*it, "z", out.z)) {
                    error = "gaze point needs numeric x, y, z";
                    return false;
                }
                out.kind = GazeKind::Point;
                return true;
            }
            error = "gaze target must be a name or a point";
            return false;
        }

        bool ReadBlinkRate(const json& j, BlinkRate& out, std::string& error) {
            auto it = j.find("rate");
            if (it == j.end()) {
                error = "missing field 'rate'";
                return false;
            }
            out.per_minute = 0.0f;
            if (it->is_number()) {
                out.kind = BlinkRateKind::PerMinute;
                out.per_minute = it->get<float>();
                if (!(out.per_minute > 0.0f)) {
                    error = "blink rate must be positive";
                    return false;
                }
                return true;
            }
            if (it->is_string() && FromName(kBlinkRateNames, it->get<std::string>(), out.kind)) {
                return true;
            }
            error = "blink rate must be 'calm', 'fast' or a number";
            return false;
        }

        bool ParsePayload(const json& j, ToolCall& call, std::string& error) {
            ToolPayload& p = call.payload;
            switch (call.type) {
            case ToolCallType::SetPose:
                return ReadEnum(j, "pose", kPoseNames, p.pose, error);
            case ToolCallType::SetGaze:
                return ReadGaze(j, p.gaze, error);
            case ToolCallType::SetExpression:
                return ReadPreset(j, p.preset, error);
            case ToolCallType::SetBlinkRate:
                return ReadBlinkRate(j, p.blink_rate, error);
            case ToolCallType::SetBreath:
                return ReadEnum(j, "level", kBreathNames, p.breath, error);
            case ToolCallType::SetIdleStyle:
                return ReadEnum(j, "style", kIdleStyleNames, p.idle_style, error);
            case ToolCallType::SetHandGesture:
                return ReadEnum(j, "gesture", kGestureNames, p.hand_gesture.gesture, error) &&
                    ReadEnum(j, "hand", kHandNames, p.hand_gesture.hand, error);
            case ToolCallType::PlayEmote:
                p.emote.intensity = 1.0f;
                p.emote.has_intensity = ReadNumber(j, "intensity", p.emote.intensity);
                if (!p.emote.has_intensity) {
                    p.emote.intensity = 1.0f;
                }
                return ReadEnum(j, "emote", kEmoteNames, p.emote.emote, error);
            case ToolCallType::SetLipSyncMode:
                return ReadEnum(j, "mode", kLipSyncNames, p.lip_sync, error);
            case ToolCallType::SetVoiceReactiveness:
            case ToolCallType::SetHairReactiveness:
                return RequireNumber(j, "level", p.level, error);
            case ToolCallType::SetLean:
                return RequireNumber(j, "amount", p.lean.amount, error) &&
                    ReadEnum(j, "axis", kLeanAxisNames, p.lean.axis, error);
            case ToolCallType::SetEyeDart:
                if (!ReadBool(j, "enabled", p.eye_dart.enabled)) {
                    error = "missing or non-boolean field 'enabled'";
                    return false;
                }
                p.eye_dart.has_rate = ReadNumber(j, "rate", p.eye_dart.rate);
                if (!p.eye_dart.has_rate) {
                    p.eye_dart.rate = 0.0f;
                }
                return true;
            case ToolCallType::SetHeadBob:
                p.head_bob.has_tempo = ReadNumber(j, "tempo", p.head_bob.tempo);
                if (!p.head_bob.has_tempo) {
                    p.head_bob.tempo = 0.0f;
                }
                return RequireNumber(j, "amount", p.head_bob.amount, error);
            case ToolCallType::PlayLookAround:
                p.look_around.has_arc = ReadNumber(j, "arc", p.look_around.arc);
                if (!p.look_around.has_arc) {
                    p.look_around.arc = 0.0f;
                }
                return RequireNumber(j, "durationMs", p.look_around.duration_ms, error);
            case ToolCallType::SetProximityReact:
                return RequireNumber(j, "distance", p.distance, error);
            case ToolCallType::SetLightingMood:
                return ReadEnum(j, "mood", kMoodNames, p.lighting, error);
            case ToolCallType::SetAvatarFocus:
                return ReadEnum(j, "target", kFocusNames, p.focus, error);
            case ToolCallType::SetPosture:
                return ReadEnum(j, "style", kPostureNames, p.posture, error);
            case ToolCallType::PlayBeatReaction:
                return true;
            }
            error = "unhandled command type";
            return false;
        }

        bool SameFloat(float a, float b) {
            return std::abs(a - b) <= 1e-6f;
        }

    }  // namespace

    // -----------------------------------------------------------------------------
    // Construction helpers
    // -----------------------------------------------------------------------------
    ToolCall ToolCall::MakeSetPose(PoseName pose, const std::string& avatar_id) {
        ToolCall call;
        call.type = ToolCallType::SetPose;
        call.payload.pose = pose;
        call.avatar_id = avatar_id;
        return call;
    }

    ToolCall ToolCall::MakeSetExpression(ExpressionPreset preset, const std::string& avatar_id) {
        ToolCall call;
        call.type = ToolCallType::SetExpression;
        call.payload.preset = preset;
        call.avatar_id = avatar_id;
        return call;
    }

    ToolCall ToolCall::MakeSetGaze(GazeKind kind, const std::string& avatar_id) {
        ToolCall call;
        call.type = ToolCallType::SetGaze;
        call.payload.gaze = GazeTarget{ kind, 0.0f, 0.0f, 0.0f };
        call.avatar_id = avatar_id;
        return call;
    }

    ToolCall ToolCall::MakePlayEmote(EmoteName emote, const std::string& avatar_id) {
        ToolCall call;
        call.type = ToolCallType::PlayEmote;
        call.payload.emote = EmotePayload{ emote, false, 1.0f };
        call.avatar_id = avatar_id;
        return call;
    }

    bool operator==(const ToolCall& a, const ToolCall& b) {
        if (a.type != b.type || a.avatar_id != b.avatar_id) {
            return false;
        }

        const ToolPayload& p = a.payload;
        const ToolPayload& q = b.payload;
        switch (a.type) {
        case ToolCallType::SetPose:
            return p.pose == q.pose;
        case ToolCallType::SetGaze:
            return p.gaze.kind == q.gaze.kind &&
                (p.gaze.kind != GazeKind::Point ||
                    (SameFloat(p.gaze.x, q.gaze.x) && SameFloat(p.gaze.y, q.gaze.y) &&
                        SameFloat(p.gaze.z, q.gaze.z)));
        case ToolCallType::SetExpression:
            return p.preset == q.preset;
        case ToolCallType::SetBlinkRate:
            return p.blink_rate.kind == q.blink_rate.kind &&
                (p.blink_rate.kind != BlinkRateKind::PerMinute ||
                    SameFloat(p.blink_rate.per_minute, q.blink_rate.per_minute));
        case ToolCallType::SetBreath:
            return p.breath == q.breath;
        case ToolCallType::SetIdleStyle:
            return p.idle_style == q.idle_style;
        case ToolCallType::SetHandGesture:
            return p.hand_gesture.gesture == q.hand_gesture.gesture &&
                p.hand_gesture.hand == q.hand_gesture.hand;
        case ToolCallType::PlayEmote:
            return p.emote.emote == q.emote.emote &&
                p.emote.has_intensity == q.emote.has_intensity &&
                (!p.emote.has_intensity || SameFloat(p.emote.intensity, q.emote.intensity));
        case ToolCallType::SetLipSyncMode:
            return p.lip_sync == q.lip_sync;
        case ToolCallType::SetVoiceReactiveness:
        case ToolCallType::SetHairReactiveness:
            return SameFloat(p.level, q.level);
        case ToolCallType::SetLean:
            return SameFloat(p.lean.amount, q.lean.amount) && p.lean.axis == q.lean.axis;
        case ToolCallType::SetEyeDart:
            return p.eye_dart.enabled == q.eye_dart.enabled &&
                p.eye_dart.has_rate == q.eye_dart.has_rate &&
                (!p.eye_dart.has_rate || SameFloat(p.eye_dart.rate, q.eye_dart.rate));
        case ToolCallType::SetHeadBob:
            return SameFloat(p.head_bob.amount, q.head_bob.amount) &&
                p.head_bob.has_tempo == q.head_bob.has_tempo &&
                (!p.head_bob.has_tempo || SameFloat(p.head_bob.tempo, q.head_bob.tempo));
        case ToolCallType::PlayLookAround:
            return SameFloat(p.look_around.duration_ms, q.look_around.duration_ms) &&
                p.look_around.has_arc == q.look_around.has_arc &&
                (!p.look_around.has_arc || SameFloat(p.look_around.arc, q.look_around.arc));
        case ToolCallType::SetProximityReact:
            return SameFloat(p.distance, q.distance);
        case ToolCallType::SetLightingMood:
            return p.lighting == q.lighting;
        case ToolCallType::SetAvatarFocus:
            return p.focus == q.focus;
        case ToolCallType::SetPosture:
            return p.posture == q.posture;
        case ToolCallType::PlayBeatReaction:
            return true;
        }
        return false;
    }

    const char* ToString(ToolCallType type) {
        return ToName(kTypeNames, type);
    }

    const char* ToString(ExpressionPreset preset) {
        return ToName(kPresetNames, preset);
    }

    // -----------------------------------------------------------------------------
    // Serialization (logging and forwarding)
    // -----------------------------------------------------------------------------
    json ToJson(const ToolCall& call) {
        json j;
        j["type"] = ToString(call.type);
        const ToolPayload& p = call.payload;

        switch (call.type) {
        case ToolCallType::SetPose:
            j["pose"] = ToName(kPoseNames, p.pose);
            break;
        case ToolCallType::SetGaze:
            if (p.gaze.kind == GazeKind::Point) {
                j["target"] = { { "x", p.gaze.x }, { "y", p.gaze.y }, { "z", p.gaze.z } };
            }
            else {
                j["target"] = ToName(kGazeNames, p.gaze.kind);
            }
            break;
        case ToolCallType::SetExpression:
            j["preset"] = ToName(kPresetNames, p.preset);
            break;
        case ToolCallType::SetBlinkRate:
            if (p.blink_rate.kind == BlinkRateKind::PerMinute) {
                j["rate"] = p.blink_rate.per_minute;
            }
            else {
                j["rate"] = ToName(kBlinkRateNames, p.blink_rate.kind);
            }
            break;
        case ToolCallType::SetBreath:
            j["level"] = ToName(kBreathNames, p.breath);
            break;
        case ToolCallType::SetIdleStyle:
            j["style"] = ToName(kIdleStyleNames, p.idle_style);
            break;
        case ToolCallType::SetHandGesture:
            j["gesture"] = ToName(kGestureNames, p.hand_gesture.gesture);
            j["hand"] = ToName(kHandNames, p.hand_gesture.hand);
            break;
        case ToolCallType::PlayEmote:
            j["emote"] = ToName(kEmoteNames, p.emote.emote);
            if (p.emote.has_intensity) {
                j["intensity"] = p.emote.intensity;
            }
            break;
        case ToolCallType::SetLipSyncMode:
            j["mode"] = ToName(kLipSyncNames, p.lip_sync);
            break;
        case ToolCallType::SetVoiceReactiveness:
        case ToolCallType::SetHairReactiveness:
            j["level"] = p.level;
            break;
        case ToolCallType::SetLean:
            j["amount"] = p.lean.amount;
            j["axis"] = ToName(kLeanAxisNames, p.lean.axis);
            break;
        case ToolCallType::SetEyeDart:
            j["enabled"] = p.eye_dart.enabled;
            if (p.eye_dart.has_rate) {
                j["rate"] = p.eye_dart.rate;
            }
            break;
        case ToolCallType::SetHeadBob:
            j["amount"] = p.head_bob.amount;
            if (p.head_bob.has_tempo) {
                j["tempo"] = p.head_bob.tempo;
            }
            break;
        case ToolCallType::PlayLookAround:
            j["durationMs"] = p.look_around.duration_ms;
            if (p.look_around.has_arc) {
                j["arc"] = p.look_around.arc;
            }
            break;
        case ToolCallType::SetProximityReact:
            j["distance"] = p.distance;
            break;
        case ToolCallType::SetLightingMood:
            j["mood"] = ToName(kMoodNames, p.lighting);
            break;
        case ToolCallType::SetAvatarFocus:
            j["target"] = ToName(kFocusNames, p.focus);
            break;
        case ToolCallType::SetPosture:
            j["style"] = ToName(kPostureNames, p.posture);
            break;
        case ToolCallType::PlayBeatReaction:
            break;
        }

        if (!call.avatar_id.empty()) {
            j["context"] = { { "avatarId", call.avatar_id } };
        }
        return j;
    }

    // -----------------------------------------------------------------------------
    // Parsing
    // -----------------------------------------------------------------------------
    ToolCallParseResult ToolCallParseResult::Ok(const ToolCall& call) {
        ToolCallParseResult r;
        r.ok_ = true;
        r.call_ = call;
        return r;
    }

    ToolCallParseResult ToolCallParseResult::Fail(const std::string& message) {
        ToolCallParseResult r;
        r.ok_ = false;
        r.error_.message = message;
        return r;
    }

    ToolCallParseResult TryParseToolCall(const json& j) {
        if (!j.is_object()) {
            return ToolCallParseResult::Fail("command must be a JSON object");
        }

        std::string type_name;
        if (!ReadString(j, "type", type_name)) {
            return ToolCallParseResult::Fail("missing or non-string field 'type'");
        }

        ToolCall call;
        if (!FromName(kTypeNames, type_name, call.type)) {
            return ToolCallParseResult::Fail("unknown command type '" + type_name + "'");
        }

        std::string error;
        if (!ParsePayload(j, call, error)) {
            return ToolCallParseResult::Fail(type_name + ": " + error);
        }

        auto ctx = j.find("context");
        if (ctx != j.end() && ctx->is_object()) {
            ReadString(*ctx, "avatarId", call.avatar_id);
        }
        return ToolCallParseResult::Ok(call);
    }

}  // namespace AVATAR
