#ifndef AUDIO_SOURCE_H_
#define AUDIO_SOURCE_H_

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace AVATAR {

    enum class TrackKind {
        Audio,
        Video,
        Unknown
    };

    // Raw media behind a track. Samples are mono floats in [-1, 1].
    class AudioStream {
    public:
        virtual ~AudioStream() = default;

        // Copies the newest `count` samples into `out` (oldest first).
        // Returns false when nothing has been captured yet.
        virtual bool ReadLatest(std::size_t count, std::vector<float>& out) = 0;
    };

    // A live track reference as handed over by the session layer.
    class AudioTrack {
    public:
        virtual ~AudioTrack() = default;

        virtual std::string GetIdentity() const = 0;
        virtual bool IsLocal() const = 0;
        virtual bool IsMuted() const = 0;
        virtual TrackKind GetKind() const = 0;

        // nullptr when no media stream can be obtained from the track.
        virtual std::shared_ptr<AudioStream> GetMediaStream() = 0;
    };

    // Stream fed by pushes from an audio callback. The producer may run on
    // the audio device thread; readers copy under the same lock.
    class RingAudioStream : public AudioStream {
    public:
        explicit RingAudioStream(std::size_t capacity = 8192);

        void Push(const float* samples, std::size_t count);
        bool ReadLatest(std::size_t count, std::vector<float>& out) override;

        std::size_t GetCapacity() const { return ring_.size(); }
        void Clear();

    private:
        std::mutex mutex_;
        std::vector<float> ring_;
        std::size_t write_index_ = 0;
        std::size_t filled_ = 0;
    };

}  // namespace AVATAR

#endif
