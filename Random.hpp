#ifndef RANDOM_H_
#define RANDOM_H_

#include <cstdint>
#include <random>

namespace AVATAR {

    // Seedable source for every randomized idle behaviour. Production runs
    // construct it unseeded; tests pass a fixed seed.
    class Random {
    public:
        Random() : engine_(std::random_device{}()) {}
        explicit Random(uint32_t seed) : engine_(seed) {}

        // Uniform in [lo, hi).
        float Uniform(float lo, float hi) {
            if (!(hi > lo)) {
                return lo;
            }
            std::uniform_real_distribution<float> dist(lo, hi);
            return dist(engine_);
        }

        // Uniform in [-bound, bound).
        float Symmetric(float bound) { return Uniform(-bound, bound); }

    private:
        std::mt19937 engine_;
    };

}  // namespace AVATAR

#endif
