#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

#ifdef UMLOSS_USE_AVX2
#include <immintrin.h>
#endif

namespace umloss {

// Squared L2 distance between two float rows, accumulated in double
inline double squared_distance(const float* __restrict a,
                               const float* __restrict b,
                               std::size_t dim) {
    double d2 = 0.0;

#ifdef UMLOSS_USE_AVX2
    // AVX2: widen 4 floats at a time to double before subtracting
    std::size_t i = 0;
    __m256d sum = _mm256_setzero_pd();
    for (; i + 4 <= dim; i += 4) {
        __m256d va = _mm256_cvtps_pd(_mm_loadu_ps(a + i));
        __m256d vb = _mm256_cvtps_pd(_mm_loadu_ps(b + i));
        __m256d diff = _mm256_sub_pd(va, vb);
        sum = _mm256_add_pd(sum, _mm256_mul_pd(diff, diff));
    }
    double temp[4];
    _mm256_storeu_pd(temp, sum);
    for (int j = 0; j < 4; ++j) {
        d2 += temp[j];
    }
    for (; i < dim; ++i) {
        double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        d2 += diff * diff;
    }
#else
    for (std::size_t i = 0; i < dim; ++i) {
        double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        d2 += diff * diff;
    }
#endif

    return d2;
}

inline double euclidean_distance(const float* __restrict a,
                                  const float* __restrict b,
                                  std::size_t dim) {
    return std::sqrt(squared_distance(a, b, dim));
}

// Hinge before square: max(0, x)^2
inline double squared_hinge(double x) {
    double h = std::max(0.0, x);
    return h * h;
}

} // namespace umloss
