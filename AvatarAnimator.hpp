#ifndef AVATAR_ANIMATOR_H_
#define AVATAR_ANIMATOR_H_

#include <memory>
#include <string>
#include <vector>

#include "AvatarConfig.hpp"
#include "EnvelopeExtractor.hpp"
#include "IdleMotion.hpp"
#include "PoseCorrection.hpp"
#include "RenderingBackend.hpp"
#include "ToolCall.hpp"
#include "VisemeHinter.hpp"

namespace AVATAR {

    enum class LoadStatus {
        Loading,
        Ready,
        Error
    };

    const char* ToString(LoadStatus status);

    // Expression channel names written every frame.
    extern const char* const kMouthOpenChannel;    // "aa"
    extern const char* const kMouthNarrowChannel;  // "ih"
    extern const char* const kMouthRoundChannel;   // "ou"
    extern const char* const kBlinkChannel;        // "blink"

    const char* ChannelForPreset(ExpressionPreset preset);

    // Per-frame compositor for one avatar. Two phases: Initialize() loads the
    // character once, then the host calls Tick() from its frame loop.
    class AvatarAnimator {
    public:
        AvatarAnimator(RenderingBackend& backend, const AvatarConfig& config);
        ~AvatarAnimator();

        AvatarAnimator(const AvatarAnimator&) = delete;
        AvatarAnimator& operator=(const AvatarAnimator&) = delete;

        LoadStatus Initialize(const std::string& source);
        // Takes a character the host already loaded; nullptr means failure.
        LoadStatus Initialize(std::unique_ptr<CharacterRig> rig);

        void Tick(double delta_time, double total_elapsed_time);

        // Stops every future write: the bound extractor is disposed, joints
        // are released and the rig is dropped. Permanent.
        void Dispose();

        void BindEnvelope(const std::shared_ptr<EnvelopeExtractor>& extractor);
        // `now` is on the same clock as Tick()'s total_elapsed_time.
        bool OnTranscript(const std::string& text, bool is_local, double now);

        void SetLipSyncMode(LipSyncMode mode) { lip_sync_mode_ = mode; }
        void SetVoiceReactiveness(float level);
        void PlayPreset(ExpressionPreset preset);

        IdleMotionGenerator& GetIdleMotion() { return idle_; }
        const IdleMotionGenerator& GetIdleMotion() const { return idle_; }
        const PoseCorrection& GetPoseCorrection() const { return pose_; }
        const VisemeHinter& GetVisemeHinter() const { return viseme_; }
        CharacterRig* GetRig() { return rig_.get(); }

        LoadStatus GetStatus() const { return status_; }
        bool IsDisposed() const { return disposed_; }
        float GetMouth() const { return mouth_; }
        double GetClock() const { return now_; }
        LipSyncMode GetLipSyncMode() const { return lip_sync_mode_; }
        float GetVoiceReactiveness() const { return voice_reactiveness_; }
        float GetPresetWeight(ExpressionPreset preset) const;

    private:
        struct PresetFader {
            ExpressionPreset preset;
            float elapsed;

            float Weight() const;
            bool Done() const;
        };

        static constexpr float kPresetFadeIn = 0.15f;
        static constexpr float kPresetHold = 1.2f;
        static constexpr float kPresetFadeOut = 0.4f;
        static constexpr double kMaxFrameDelta = 0.25;

        LoadStatus AttachRig(std::unique_ptr<CharacterRig> rig);
        void ReleaseRig();
        float MouthTarget() const;
        void WriteExpressions(float dt);

        RenderingBackend& backend_;
        AvatarConfig config_;

        std::unique_ptr<CharacterRig> rig_;
        LoadStatus status_ = LoadStatus::Loading;
        bool disposed_ = false;

        std::shared_ptr<EnvelopeExtractor> envelope_;
        VisemeHinter viseme_;
        IdleMotionGenerator idle_;
        PoseCorrection pose_;

        double now_ = 0.0;
        float mouth_ = 0.0f;
        LipSyncMode lip_sync_mode_ = LipSyncMode::Live;
        float voice_reactiveness_ = 1.0f;
        std::vector<PresetFader> presets_;
    };

}  // namespace AVATAR

#endif
