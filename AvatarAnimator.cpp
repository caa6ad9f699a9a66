#include "AvatarAnimator.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <utility>

namespace AVATAR {

    constexpr float AvatarAnimator::kPresetFadeIn;
    constexpr float AvatarAnimator::kPresetHold;
    constexpr float AvatarAnimator::kPresetFadeOut;
    constexpr double AvatarAnimator::kMaxFrameDelta;

    const char* const kMouthOpenChannel = "aa";
    const char* const kMouthNarrowChannel = "ih";
    const char* const kMouthRoundChannel = "ou";
    const char* const kBlinkChannel = "blink";

    const char* ToString(LoadStatus status) {
        switch (status) {
        case LoadStatus::Loading: return "loading";
        case LoadStatus::Ready:   return "ready";
        case LoadStatus::Error:   return "error";
        }
        return "error";
    }

    const char* ChannelForPreset(ExpressionPreset preset) {
        switch (preset) {
        case ExpressionPreset::Smile:     return "happy";
        case ExpressionPreset::Surprised: return "surprised";
        case ExpressionPreset::Concerned: return "sad";
        case ExpressionPreset::Wink:      return "blinkLeft";
        case ExpressionPreset::Laugh:     return "relaxed";
        case ExpressionPreset::Blink:     return kBlinkChannel;
        }
        return "";
    }

    // -----------------------------------------------------------------------------
    // Preset fade: ramp in, hold, ramp out.
    // -----------------------------------------------------------------------------
    float AvatarAnimator::PresetFader::Weight() const {
        if (elapsed < kPresetFadeIn) {
            return elapsed / kPresetFadeIn;
        }
        float t = elapsed - kPresetFadeIn;
        if (t < kPresetHold) {
            return 1.0f;
        }
        t -= kPresetHold;
        return std::max(0.0f, 1.0f - t / kPresetFadeOut);
    }

    bool AvatarAnimator::PresetFader::Done() const {
        return elapsed >= kPresetFadeIn + kPresetHold + kPresetFadeOut;
    }

    AvatarAnimator::AvatarAnimator(RenderingBackend& backend, const AvatarConfig& config)
        : backend_(backend),
        config_(config),
        viseme_(config.viseme_window),
        idle_(config.has_random_seed ? IdleMotionGenerator(config.random_seed)
            : IdleMotionGenerator()),
        pose_(config.pose_correction, config.mirror_arms) {
    }

    AvatarAnimator::~AvatarAnimator() {
        Dispose();
    }

    LoadStatus AvatarAnimator::Initialize(const std::string& source) {
        if (disposed_) {
            std::cerr << "[Animator] ERROR: initialize after dispose\n";
            return LoadStatus::Error;
        }
        status_ = LoadStatus::Loading;
        std::cout << "[Animator] loading character from " << source << "\n";

        std::unique_ptr<CharacterRig> rig = backend_.LoadCharacter(source);
        if (!rig) {
            std::cerr << "[Animator] ERROR: failed to load character " << source << "\n";
        }
        return Initialize(std::move(rig));
    }

    LoadStatus AvatarAnimator::Initialize(std::unique_ptr<CharacterRig> rig) {
        if (disposed_) {
            std::cerr << "[Animator] ERROR: initialize after dispose\n";
            return LoadStatus::Error;
        }
        ReleaseRig();
        if (!rig) {
            status_ = LoadStatus::Error;
            return status_;
        }
        return AttachRig(std::move(rig));
    }

    LoadStatus AvatarAnimator::AttachRig(std::unique_ptr<CharacterRig> rig) {
        rig_ = std::move(rig);

        // Idle bases come from the untouched rest pose; correction goes on top.
        std::size_t idle_count = idle_.CaptureJoints(*rig_, config_.idle_joints,
            config_.rest_roll_deg);
        std::size_t corrected = pose_.Capture(*rig_);

        for (const char* channel : { kMouthOpenChannel, kMouthNarrowChannel,
            kMouthRoundChannel, kBlinkChannel }) {
            if (!rig_->HasExpression(channel)) {
                std::cerr << "[Animator] WARNING: character has no '" << channel
                    << "' expression\n";
            }
        }

        mouth_ = 0.0f;
        presets_.clear();
        viseme_.Clear();
        status_ = LoadStatus::Ready;
        std::cout << "[Animator] ready (" << idle_count << " idle joints, "
            << corrected << " corrected joints)\n";
        return status_;
    }

    void AvatarAnimator::ReleaseRig() {
        idle_.Release();
        pose_.Release();
        rig_.reset();
    }

    void AvatarAnimator::Dispose() {
        if (disposed_) {
            return;
        }
        disposed_ = true;
        if (envelope_) {
            envelope_->Dispose();
            envelope_.reset();
        }
        ReleaseRig();
        presets_.clear();
        std::cout << "[Animator] disposed\n";
    }

    void AvatarAnimator::BindEnvelope(const std::shared_ptr<EnvelopeExtractor>& extractor) {
        if (disposed_) {
            return;
        }
        envelope_ = extractor;
    }

    bool AvatarAnimator::OnTranscript(const std::string& text, bool is_local, double now) {
        if (disposed_) {
            return false;
        }
        return viseme_.OnTranscript(text, is_local, now);
    }

    void AvatarAnimator::SetVoiceReactiveness(float level) {
        voice_reactiveness_ = std::max(0.0f, std::min(1.0f, level));
    }

    void AvatarAnimator::PlayPreset(ExpressionPreset preset) {
        if (preset == ExpressionPreset::Blink) {
            idle_.TriggerBlink();
            return;
        }
        // Restart a preset that is already fading.
        for (PresetFader& f : presets_) {
            if (f.preset == preset) {
                f.elapsed = 0.0f;
                return;
            }
        }
        presets_.push_back(PresetFader{ preset, 0.0f });
    }

    float AvatarAnimator::GetPresetWeight(ExpressionPreset preset) const {
        for (const PresetFader& f : presets_) {
            if (f.preset == preset) {
                return f.Weight();
            }
        }
        return 0.0f;
    }

    float AvatarAnimator::MouthTarget() const {
        // A source that is not ready yet reads as silence.
        float env = (envelope_ && envelope_->IsReady()) ? envelope_->GetEnvelope() : 0.0f;
        env *= voice_reactiveness_;
        switch (lip_sync_mode_) {
        case LipSyncMode::Muted:
            env = 0.0f;
            break;
        case LipSyncMode::Exaggerated:
            env *= 1.5f;
            break;
        case LipSyncMode::Live:
            break;
        }
        return std::max(0.0f, std::min(1.0f, env));
    }

    // -----------------------------------------------------------------------------
    // Per-frame entry point.
    // -----------------------------------------------------------------------------
    void AvatarAnimator::Tick(double delta_time, double total_elapsed_time) {
        if (disposed_ || status_ != LoadStatus::Ready || !rig_) {
            return;
        }

        now_ = total_elapsed_time;
        const float dt = static_cast<float>(std::max(0.0, std::min(delta_time, kMaxFrameDelta)));

        mouth_ = ExpDamp(mouth_, MouthTarget(), config_.mouth_damping, dt);
        mouth_ = std::max(0.0f, std::min(1.0f, mouth_));

        idle_.Advance(dt);

        WriteExpressions(dt);

        idle_.Apply();
        rig_->SetLookAtTarget(idle_.GetLookTarget());

        // Must run after idle motion so the relaxed arm pose wins.
        pose_.Apply();

        backend_.AdvanceClips(*rig_, dt);
        backend_.Update(*rig_, dt);
        backend_.RenderFrame(*rig_);
    }

    void AvatarAnimator::WriteExpressions(float dt) {
        CharacterRig& rig = *rig_;

        const VisemeShape shape = viseme_.ActiveShape(now_);
        const float shaped = config_.viseme_weight * mouth_;
        rig.SetExpression(kMouthOpenChannel, mouth_);
        rig.SetExpression(kMouthNarrowChannel, shape == VisemeShape::Narrow ? shaped : 0.0f);
        rig.SetExpression(kMouthRoundChannel, shape == VisemeShape::Round ? shaped : 0.0f);
        rig.SetExpression(kBlinkChannel, idle_.GetBlink().value);

        for (PresetFader& f : presets_) {
            f.elapsed += dt;
            rig.SetExpression(ChannelForPreset(f.preset), f.Done() ? 0.0f : f.Weight());
        }
        presets_.erase(std::remove_if(presets_.begin(), presets_.end(),
            [](const PresetFader& f) { return f.Done(); }), presets_.end());
    }

}  // namespace AVATAR
