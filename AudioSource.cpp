#include "AudioSource.hpp"

#include <algorithm>

namespace AVATAR {

    RingAudioStream::RingAudioStream(std::size_t capacity)
        : ring_(std::max<std::size_t>(capacity, 1), 0.0f) {
    }

    void RingAudioStream::Push(const float* samples, std::size_t count) {
        if (samples == nullptr || count == 0) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t cap = ring_.size();

        // Only the tail of an oversized push can survive.
        if (count > cap) {
            samples += count - cap;
            count = cap;
        }

        for (std::size_t i = 0; i < count; ++i) {
            ring_[write_index_] = samples[i];
            write_index_ = (write_index_ + 1) % cap;
        }
        filled_ = std::min(cap, filled_ + count);
    }

    bool RingAudioStream::ReadLatest(std::size_t count, std::vector<float>& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (filled_ == 0 || count == 0) {
            return false;
        }

        const std::size_t cap = ring_.size();
        const std::size_t n = std::min(count, filled_);
        out.resize(n);

        std::size_t start = (write_index_ + cap - n) % cap;
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = ring_[(start + i) % cap];
        }
        return true;
    }

    void RingAudioStream::Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::fill(ring_.begin(), ring_.end(), 0.0f);
        write_index_ = 0;
        filled_ = 0;
    }

}  // namespace AVATAR
