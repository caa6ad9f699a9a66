#ifndef SDL_AUDIO_SOURCES_H_
#define SDL_AUDIO_SOURCES_H_

#include <memory>
#include <string>

#include <SDL.h>
#include <SDL_mixer.h>

#include "AudioSource.hpp"

namespace AVATAR {

    // Remote speech played through SDL_mixer. A channel effect copies every
    // mixed buffer into the ring stream before it reaches the device.
    class MixerChannelTrack : public AudioTrack {
    public:
        explicit MixerChannelTrack(const std::string& identity);
        ~MixerChannelTrack() override;

        MixerChannelTrack(const MixerChannelTrack&) = delete;
        MixerChannelTrack& operator=(const MixerChannelTrack&) = delete;

        // Taps `channel`; call right after Mix_PlayChannel.
        bool Register(int channel);
        void Unregister();

        std::string GetIdentity() const override { return identity_; }
        bool IsLocal() const override { return false; }
        bool IsMuted() const override;
        TrackKind GetKind() const override { return TrackKind::Audio; }
        std::shared_ptr<AudioStream> GetMediaStream() override;

        int GetChannel() const { return channel_; }

    private:
        static void EffectCallback(int channel, void* stream, int len, void* udata);

        std::string identity_;
        std::shared_ptr<RingAudioStream> stream_;
        int channel_ = -1;
        Uint16 format_ = AUDIO_S16SYS;
        int channels_ = 2;
    };

    // The user's microphone. Local, so the extractor refuses it unless the
    // configuration allows lip-syncing to local audio.
    class CaptureDeviceTrack : public AudioTrack {
    public:
        explicit CaptureDeviceTrack(const std::string& identity);
        ~CaptureDeviceTrack() override;

        CaptureDeviceTrack(const CaptureDeviceTrack&) = delete;
        CaptureDeviceTrack& operator=(const CaptureDeviceTrack&) = delete;

        bool Open(int frequency = 44100);
        void Close();

        std::string GetIdentity() const override { return identity_; }
        bool IsLocal() const override { return true; }
        bool IsMuted() const override { return device_ == 0; }
        TrackKind GetKind() const override { return TrackKind::Audio; }
        std::shared_ptr<AudioStream> GetMediaStream() override;

    private:
        static void CaptureCallback(void* udata, Uint8* stream, int len);

        std::string identity_;
        std::shared_ptr<RingAudioStream> stream_;
        SDL_AudioDeviceID device_ = 0;
    };

}  // namespace AVATAR

#endif
