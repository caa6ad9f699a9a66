#include "EnvelopeExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace AVATAR {

    constexpr float EnvelopeExtractor::kTickSeconds;

    const char* ToString(EnvelopeStatus status) {
        switch (status) {
        case EnvelopeStatus::Idle:       return "idle";
        case EnvelopeStatus::NoTrack:    return "no-track";
        case EnvelopeStatus::LocalTrack: return "local-track";
        case EnvelopeStatus::NonAudio:   return "non-audio";
        case EnvelopeStatus::NoMedia:    return "no-media";
        case EnvelopeStatus::Running:    return "running";
        case EnvelopeStatus::Stopped:    return "stopped";
        case EnvelopeStatus::Disposed:   return "disposed";
        }
        return "unknown";
    }

    EnvelopeExtractor::EnvelopeExtractor(const EnvelopeConfig& config,
        bool allow_local_audio)
        : allow_local_audio_(allow_local_audio) {
        state_.config = config;
        if (state_.config.window == 0) {
            state_.config.window = 1;
        }
        window_.reserve(state_.config.window);
    }

    EnvelopeExtractor::~EnvelopeExtractor() {
        Detach();
    }

    EnvelopeStatus EnvelopeExtractor::Attach(const std::shared_ptr<AudioTrack>& track) {
        if (disposed_) {
            return status_;
        }
        Detach();

        if (!track) {
            status_ = EnvelopeStatus::NoTrack;
            return status_;
        }

        // Never lip-sync to the user's own voice unless asked to.
        if (track->IsLocal() && !allow_local_audio_) {
            std::cout << "[Envelope] refusing local track " << track->GetIdentity() << "\n";
            status_ = EnvelopeStatus::LocalTrack;
            return status_;
        }

        if (track->GetKind() != TrackKind::Audio) {
            std::cerr << "[Envelope] WARNING: track " << track->GetIdentity()
                << " is not an audio track\n";
            status_ = EnvelopeStatus::NonAudio;
            return status_;
        }

        std::shared_ptr<AudioStream> stream = track->GetMediaStream();
        if (!stream) {
            std::cerr << "[Envelope] WARNING: no media stream on track "
                << track->GetIdentity() << "\n";
            status_ = EnvelopeStatus::NoMedia;
            return status_;
        }

        std::cout << "[Envelope] starting analyser for " << track->GetIdentity()
            << " (muted: " << (track->IsMuted() ? "yes" : "no") << ")\n";

        track_ = track;
        stream_ = std::move(stream);
        ResetSignal();
        status_ = EnvelopeStatus::Running;
        return status_;
    }

    void EnvelopeExtractor::Detach() {
        if (!stream_ && !track_) {
            return;
        }
        std::cout << "[Envelope] releasing analyser for "
            << (track_ ? track_->GetIdentity() : std::string("?")) << "\n";
        stream_.reset();
        track_.reset();
        ResetSignal();
        if (!disposed_) {
            status_ = EnvelopeStatus::Stopped;
        }
    }

    void EnvelopeExtractor::Dispose() {
        if (disposed_) {
            return;
        }
        Detach();
        disposed_ = true;
        status_ = EnvelopeStatus::Disposed;
        listener_ = nullptr;
    }

    void EnvelopeExtractor::Tick() {
        if (disposed_ || !stream_) {
            return;
        }
        if (!stream_->ReadLatest(state_.config.window, window_)) {
            // Nothing captured yet: analyse silence so the mouth settles.
            window_.assign(state_.config.window, 0.0f);
        }
        ProcessWindow(window_.data(), window_.size());
    }

    void EnvelopeExtractor::ProcessWindow(const float* samples, std::size_t count) {
        // Stale callbacks after teardown must not touch state.
        if (disposed_) {
            return;
        }

        const EnvelopeConfig& cfg = state_.config;
        const float dt = kTickSeconds;

        float rms = ComputeRms(samples, count);
        float rms_decay = cfg.rms_tau > 0.0f ? std::exp(-dt / cfg.rms_tau) : 0.0f;
        if (std::isfinite(rms)) {
            state_.smoothed_rms = rms * (1.0f - rms_decay) + state_.smoothed_rms * rms_decay;
        }

        float gated = std::max(0.0f, state_.smoothed_rms - cfg.gate_threshold) * cfg.gain;
        state_.target_envelope = std::min(std::max(gated * cfg.scale, 0.0f), 1.0f);
        state_.envelope = Follow(state_.envelope, state_.target_envelope, dt, cfg);
        ++ticks_;

        if (listener_) {
            listener_(state_.envelope);
        }
    }

    float EnvelopeExtractor::ComputeRms(const float* samples, std::size_t count) {
        if (samples == nullptr || count == 0) {
            return 0.0f;
        }
        // Non-finite samples from a glitching decoder are dropped.
        double sum = 0.0;
        std::size_t used = 0;
        for (std::size_t i = 0; i < count; ++i) {
            if (!std::isfinite(samples[i])) {
                continue;
            }
            sum += static_cast<double>(samples[i]) * samples[i];
            ++used;
        }
        if (used == 0 || !std::isfinite(sum)) {
            return 0.0f;
        }
        return static_cast<float>(std::sqrt(sum / static_cast<double>(used)));
    }

    float EnvelopeExtractor::Follow(float envelope, float target, float dt,
        const EnvelopeConfig& config) {
        float tau = target > envelope ? config.attack_tau : config.release_tau;
        float coef = tau > 0.0f ? std::exp(-dt / tau) : 0.0f;
        float next = target + (envelope - target) * coef;
        return std::min(std::max(next, 0.0f), 1.0f);
    }

    void EnvelopeExtractor::ResetSignal() {
        state_.smoothed_rms = 0.0f;
        state_.envelope = 0.0f;
        state_.target_envelope = 0.0f;
        ticks_ = 0;
    }

}  // namespace AVATAR
