#pragma once

#include "errors.hpp"
#include <cstdint>
#include <cmath>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace umloss {
namespace core {

// N points of dimension dim, one label each (row-major features)
struct PointStore {
    std::vector<float>   features;   // N * dim
    std::vector<int64_t> labels;     // N
    uint32_t N = 0;
    uint32_t dim = 0;

    std::span<const float> row(uint32_t i) const {
        if (i >= N) {
            return std::span<const float>();
        }
        return std::span<const float>(features.data() + static_cast<size_t>(i) * dim, dim);
    }

    uint32_t size() const {
        return N;
    }
};

// Throws InvalidInput if the store cannot be fed to the MST builder
inline void validate(const PointStore& store) {
    if (store.N == 0) {
        throw InvalidInput("empty point set");
    }
    if (store.dim == 0) {
        throw InvalidInput("points have zero dimensions");
    }
    if (store.features.size() != static_cast<size_t>(store.N) * store.dim) {
        throw InvalidInput("feature buffer holds " + std::to_string(store.features.size()) +
                           " values, expected " + std::to_string(static_cast<size_t>(store.N) * store.dim));
    }
    if (store.labels.size() != store.N) {
        throw InvalidInput("got " + std::to_string(store.labels.size()) + " labels for " +
                           std::to_string(store.N) + " points");
    }
    for (size_t i = 0; i < store.features.size(); ++i) {
        if (!std::isfinite(store.features[i])) {
            throw InvalidInput("non-finite embedding value at point " + std::to_string(i / store.dim));
        }
    }
}

// Copy a row-major float buffer and its labels into a validated store
inline PointStore make_point_store(const float* X,
                                   uint32_t N,
                                   uint32_t D,
                                   const int64_t* labels) {
    PointStore store;
    store.N = N;
    store.dim = D;
    if (X != nullptr) {
        store.features.assign(X, X + static_cast<size_t>(N) * D);
    }
    if (labels != nullptr) {
        store.labels.assign(labels, labels + N);
    }
    validate(store);
    return store;
}

inline PointStore make_point_store(std::vector<float> features,
                                   std::vector<int64_t> labels,
                                   uint32_t D) {
    PointStore store;
    store.dim = D;
    store.N = D == 0 ? 0 : static_cast<uint32_t>(features.size() / D);
    store.features = std::move(features);
    store.labels = std::move(labels);
    validate(store);
    return store;
}

} // namespace core
} // namespace umloss
