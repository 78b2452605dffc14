#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace umloss {

using Rng = std::mt19937_64;

// Synthetic point clouds for tests and benchmarks
class RngManager {
public:
    static Rng create_rng(uint64_t seed) {
        Rng rng(seed);
        return rng;
    }

    template<typename T>
    static T uniform_int(Rng& rng, T min, T max) {
        std::uniform_int_distribution<T> dist(min, max);
        return dist(rng);
    }

    static float uniform_real(Rng& rng, float min = 0.0f, float max = 1.0f) {
        std::uniform_real_distribution<float> dist(min, max);
        return dist(rng);
    }

    // N * dim values uniform in [0, 1)
    static std::vector<float> uniform_points(Rng& rng, uint32_t N, uint32_t dim) {
        std::vector<float> X(static_cast<size_t>(N) * dim);
        for (float& x : X) {
            x = uniform_real(rng);
        }
        return X;
    }

    // N labels drawn from [0, num_labels)
    static std::vector<int64_t> random_labels(Rng& rng, uint32_t N, int64_t num_labels) {
        std::vector<int64_t> labels(N);
        for (auto& l : labels) {
            l = uniform_int<int64_t>(rng, 0, num_labels - 1);
        }
        return labels;
    }
};

} // namespace umloss
