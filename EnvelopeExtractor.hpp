#ifndef ENVELOPE_EXTRACTOR_H_
#define ENVELOPE_EXTRACTOR_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "AudioSource.hpp"

namespace AVATAR {

    struct EnvelopeConfig {
        float gate_threshold = 0.03f;
        float attack_tau = 0.040f;   // seconds
        float release_tau = 0.220f;  // seconds
        float rms_tau = 0.080f;      // seconds
        float gain = 2.0f;
        float scale = 3.2f;
        std::size_t window = 2048;   // samples per analysis tick
    };

    struct AudioEnvelopeState {
        float smoothed_rms = 0.0f;
        float envelope = 0.0f;
        float target_envelope = 0.0f;
        EnvelopeConfig config;
    };

    enum class EnvelopeStatus {
        Idle,
        NoTrack,
        LocalTrack,
        NonAudio,
        NoMedia,
        Running,
        Stopped,
        Disposed
    };

    const char* ToString(EnvelopeStatus status);

    // Turns a live audio track into a smoothed [0,1] mouth-openness value.
    // Tick() is the analysis driver entry point and always advances by a
    // fixed 1/60 s, whatever rate the host actually calls it at.
    class EnvelopeExtractor {
    public:
        static constexpr float kTickSeconds = 1.0f / 60.0f;

        explicit EnvelopeExtractor(const EnvelopeConfig& config = EnvelopeConfig(),
            bool allow_local_audio = false);
        ~EnvelopeExtractor();

        EnvelopeExtractor(const EnvelopeExtractor&) = delete;
        EnvelopeExtractor& operator=(const EnvelopeExtractor&) = delete;

        // Releases any previous stream, then validates and binds `track`.
        EnvelopeStatus Attach(const std::shared_ptr<AudioTrack>& track);
        void Detach();

        // Permanent teardown. Later ticks and windows are ignored.
        void Dispose();

        void Tick();
        void ProcessWindow(const float* samples, std::size_t count);

        float GetEnvelope() const { return state_.envelope; }
        bool IsReady() const { return status_ == EnvelopeStatus::Running && ticks_ > 0; }
        bool IsDisposed() const { return disposed_; }
        const AudioEnvelopeState& GetState() const { return state_; }
        EnvelopeStatus GetStatus() const { return status_; }

        // Called with the clamped envelope after every processed window.
        void SetListener(std::function<void(float)> listener) {
            listener_ = std::move(listener);
        }

        static float ComputeRms(const float* samples, std::size_t count);
        // One attack/release step of `envelope` toward `target`.
        static float Follow(float envelope, float target, float dt,
            const EnvelopeConfig& config);

    private:
        void ResetSignal();

        AudioEnvelopeState state_;
        EnvelopeStatus status_ = EnvelopeStatus::Idle;
        bool allow_local_audio_ = false;
        bool disposed_ = false;
        unsigned long ticks_ = 0;

        std::shared_ptr<AudioTrack> track_;
        std::shared_ptr<AudioStream> stream_;
        std::vector<float> window_;
        std::function<void(float)> listener_;
    };

}  // namespace AVATAR

#endif
