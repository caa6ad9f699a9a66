#include "SdlAudioSources.hpp"

#include <iostream>
#include <vector>

namespace AVATAR {

    namespace {
        // Interleaved mixer output folded to mono floats.
        std::vector<float> ToMono(const void* data, int len, Uint16 format, int channels) {
            std::vector<float> mono;
            if (channels <= 0 || len <= 0) {
                return mono;
            }

            if (format == AUDIO_F32SYS) {
                const float* in = static_cast<const float*>(data);
                int frames = len / static_cast<int>(sizeof(float)) / channels;
                mono.resize(static_cast<std::size_t>(frames));
                for (int f = 0; f < frames; ++f) {
                    float sum = 0.0f;
                    for (int c = 0; c < channels; ++c) {
                        sum += in[f * channels + c];
                    }
                    mono[static_cast<std::size_t>(f)] = sum / channels;
                }
            }
            else if (format == AUDIO_S16SYS) {
                const Sint16* in = static_cast<const Sint16*>(data);
                int frames = len / static_cast<int>(sizeof(Sint16)) / channels;
                mono.resize(static_cast<std::size_t>(frames));
                for (int f = 0; f < frames; ++f) {
                    float sum = 0.0f;
                    for (int c = 0; c < channels; ++c) {
                        sum += in[f * channels + c] / 32768.0f;
                    }
                    mono[static_cast<std::size_t>(f)] = sum / channels;
                }
            }
            return mono;
        }
    }  // namespace

    // -----------------------------------------------------------------------------
    // SDL_mixer channel tap
    // -----------------------------------------------------------------------------
    MixerChannelTrack::MixerChannelTrack(const std::string& identity)
        : identity_(identity), stream_(std::make_shared<RingAudioStream>()) {
    }

    MixerChannelTrack::~MixerChannelTrack() {
        Unregister();
    }

    bool MixerChannelTrack::Register(int channel) {
        Unregister();
        if (channel < 0) {
            return false;
        }

        int frequency = 0;
        int channels = 0;
        Uint16 format = 0;
        if (Mix_QuerySpec(&frequency, &format, &channels) == 0) {
            std::cerr << "[Audio] ERROR: mixer not open: " << Mix_GetError() << "\n";
            return false;
        }
        if (format != AUDIO_S16SYS && format != AUDIO_F32SYS) {
            std::cerr << "[Audio] WARNING: unsupported mixer format " << format
                << ", lip sync will see silence\n";
        }
        format_ = format;
        channels_ = channels;

        if (Mix_RegisterEffect(channel, &MixerChannelTrack::EffectCallback, nullptr, this) == 0) {
            std::cerr << "[Audio] ERROR: Mix_RegisterEffect failed: " << Mix_GetError() << "\n";
            return false;
        }
        channel_ = channel;
        stream_->Clear();
        std::cout << "[Audio] tapping mixer channel " << channel << " (" << frequency
            << " Hz, " << channels << " ch)\n";
        return true;
    }

    void MixerChannelTrack::Unregister() {
        if (channel_ < 0) {
            return;
        }
        // Takes the audio lock, so no callback is running once this returns.
        Mix_UnregisterEffect(channel_, &MixerChannelTrack::EffectCallback);
        channel_ = -1;
    }

    bool MixerChannelTrack::IsMuted() const {
        return channel_ < 0 || Mix_Playing(channel_) == 0 || Mix_Volume(channel_, -1) == 0;
    }

    std::shared_ptr<AudioStream> MixerChannelTrack::GetMediaStream() {
        if (channel_ < 0) {
            return nullptr;
        }
        return stream_;
    }

    void MixerChannelTrack::EffectCallback(int, void* stream, int len, void* udata) {
        MixerChannelTrack* self = static_cast<MixerChannelTrack*>(udata);
        std::vector<float> mono = ToMono(stream, len, self->format_, self->channels_);
        self->stream_->Push(mono.data(), mono.size());
    }

    // -----------------------------------------------------------------------------
    // SDL capture device
    // -----------------------------------------------------------------------------
    CaptureDeviceTrack::CaptureDeviceTrack(const std::string& identity)
        : identity_(identity), stream_(std::make_shared<RingAudioStream>()) {
    }

    CaptureDeviceTrack::~CaptureDeviceTrack() {
        Close();
    }

    bool CaptureDeviceTrack::Open(int frequency) {
        Close();

        SDL_AudioSpec want;
        SDL_AudioSpec have;
        SDL_zero(want);
        want.freq = frequency;
        want.format = AUDIO_F32SYS;
        want.channels = 1;
        want.samples = 1024;
        want.callback = &CaptureDeviceTrack::CaptureCallback;
        want.userdata = this;

        device_ = SDL_OpenAudioDevice(nullptr, 1, &want, &have, 0);
        if (device_ == 0) {
            std::cerr << "[Audio] ERROR: SDL_OpenAudioDevice (capture) failed: "
                << SDL_GetError() << "\n";
            return false;
        }
        stream_->Clear();
        SDL_PauseAudioDevice(device_, 0);
        std::cout << "[Audio] capturing from default input at " << have.freq << " Hz\n";
        return true;
    }

    void CaptureDeviceTrack::Close() {
        if (device_ == 0) {
            return;
        }
        SDL_CloseAudioDevice(device_);
        device_ = 0;
    }

    std::shared_ptr<AudioStream> CaptureDeviceTrack::GetMediaStream() {
        if (device_ == 0) {
            return nullptr;
        }
        return stream_;
    }

    void CaptureDeviceTrack::CaptureCallback(void* udata, Uint8* stream, int len) {
        CaptureDeviceTrack* self = static_cast<CaptureDeviceTrack*>(udata);
        const float* samples = reinterpret_cast<const float*>(stream);
        self->stream_->Push(samples, static_cast<std::size_t>(len) / sizeof(float));
    }

}  // namespace AVATAR
