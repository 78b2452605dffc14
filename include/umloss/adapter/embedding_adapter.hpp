#pragma once

#include "../core/errors.hpp"
#include "../core/point_store.hpp"
#include "../graph/emst.hpp"
#include "../math/kernels.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace umloss {
namespace adapter {

// Channel-major embedding of a volume: data[c * voxels + (z * h + y) * w + x].
// 2D images use depth 1.
struct EmbeddingTensor {
    std::vector<float> data;
    uint32_t channels = 0;
    std::array<uint32_t, 3> shape = {0, 0, 0};   // (depth, height, width)

    size_t num_voxels() const {
        return static_cast<size_t>(shape[0]) * shape[1] * shape[2];
    }
};

struct AdapterConfig {
    bool add_coordinates = true;
    std::array<double, 3> coordinate_scale = {1.0, 1.0, 1.0};   // (z, y, x)
};

// Points extracted from a tensor, remembering the voxel each came from
struct FlatPoints {
    core::PointStore store;
    std::vector<uint32_t> point_to_voxel;
    uint32_t embedding_channels = 0;   // leading feature channels that came from the tensor
};

// With coordinates appended, ultrametrics lie roughly in
// [min(scale), sqrt(max(scale)^2 + k)] for an embedding in [0, 1]^k.
// Returns true (and warns on stderr) if alpha does not fit that range.
inline bool alpha_too_big(const AdapterConfig& cfg, uint32_t channels, double alpha) {
    if (!cfg.add_coordinates) {
        return false;
    }
    const auto& s = cfg.coordinate_scale;
    double max_scale = *std::max_element(s.begin(), s.end());
    double min_scale = *std::min_element(s.begin(), s.end());
    double min_d = min_scale;
    double max_d = std::sqrt(max_scale * max_scale + channels);

    if (max_d - min_d < alpha) {
        std::cerr << "Warning: alpha " << alpha << " is too big: min and max ultrametric "
                  << "between any pair of points is " << min_d << " and " << max_d
                  << " (this assumes your embedding is in [0, 1], if it is not, "
                  << "you might ignore this warning)\n";
        return true;
    }
    return false;
}

// Flatten a tensor into one point per voxel, optionally augmented by its
// scaled (z, y, x) position. Voxels with mask == 0 are dropped; an empty
// mask keeps everything.
inline FlatPoints to_point_store(const EmbeddingTensor& tensor,
                                 std::span<const int64_t> labels,
                                 std::span<const uint8_t> mask,
                                 const AdapterConfig& cfg = {}) {
    const size_t V = tensor.num_voxels();
    const uint32_t K = tensor.channels;

    if (K == 0 || V == 0) {
        throw core::InvalidInput("embedding tensor is empty");
    }
    if (tensor.data.size() != V * K) {
        throw core::InvalidInput("embedding holds " + std::to_string(tensor.data.size()) +
                                 " values, shape implies " + std::to_string(V * K));
    }
    if (labels.size() != V) {
        throw core::InvalidInput("got " + std::to_string(labels.size()) + " labels for " +
                                 std::to_string(V) + " voxels");
    }
    if (!mask.empty() && mask.size() != V) {
        throw core::InvalidInput("mask has " + std::to_string(mask.size()) + " entries for " +
                                 std::to_string(V) + " voxels");
    }
    if (cfg.add_coordinates) {
        for (double s : cfg.coordinate_scale) {
            if (!std::isfinite(s) || s < 0.0) {
                throw core::InvalidInput("coordinate scale must be finite and non-negative");
            }
        }
    }

    const uint32_t dim = K + (cfg.add_coordinates ? 3 : 0);
    const uint32_t H = tensor.shape[1];
    const uint32_t W = tensor.shape[2];

    FlatPoints flat;
    flat.embedding_channels = K;
    std::vector<float> features;
    std::vector<int64_t> kept_labels;
    features.reserve(V * dim);
    kept_labels.reserve(V);

    for (size_t vox = 0; vox < V; ++vox) {
        if (!mask.empty() && mask[vox] == 0) continue;

        for (uint32_t c = 0; c < K; ++c) {
            features.push_back(tensor.data[c * V + vox]);
        }
        if (cfg.add_coordinates) {
            const size_t z = vox / (static_cast<size_t>(H) * W);
            const size_t y = (vox / W) % H;
            const size_t x = vox % W;
            features.push_back(static_cast<float>(z * cfg.coordinate_scale[0]));
            features.push_back(static_cast<float>(y * cfg.coordinate_scale[1]));
            features.push_back(static_cast<float>(x * cfg.coordinate_scale[2]));
        }
        kept_labels.push_back(labels[vox]);
        flat.point_to_voxel.push_back(static_cast<uint32_t>(vox));
    }

    if (kept_labels.empty()) {
        throw core::InvalidInput("mask removes every voxel");
    }
    flat.store = core::make_point_store(std::move(features), std::move(kept_labels), dim);
    return flat;
}

// Edge lengths recomputed from point features
inline std::vector<double> edge_lengths(const core::PointStore& store,
                                        const std::vector<graph::Edge>& edges) {
    std::vector<double> lengths(edges.size());
    for (size_t e = 0; e < edges.size(); ++e) {
        lengths[e] = euclidean_distance(store.row(edges[e].u).data(),
                                        store.row(edges[e].v).data(),
                                        store.dim);
    }
    return lengths;
}

// Chain dloss/ddistance through |x_u - x_v| onto the point features.
// Returns N * dim values; zero-length edges pass no gradient.
inline std::vector<double> point_gradient(const core::PointStore& store,
                                          const std::vector<graph::Edge>& edges,
                                          std::span<const float> edge_grad,
                                          double dloss = 1.0) {
    if (edge_grad.size() != edges.size()) {
        throw core::InvalidInput("gradient has " + std::to_string(edge_grad.size()) +
                                 " entries for " + std::to_string(edges.size()) + " edges");
    }

    const uint32_t D = store.dim;
    std::vector<double> grad(static_cast<size_t>(store.N) * D, 0.0);
    std::vector<double> lengths = edge_lengths(store, edges);

    for (size_t e = 0; e < edges.size(); ++e) {
        if (lengths[e] <= 0.0 || edge_grad[e] == 0.0f) continue;

        const double coeff = static_cast<double>(edge_grad[e]) * dloss / lengths[e];
        auto xu = store.row(edges[e].u);
        auto xv = store.row(edges[e].v);
        double* gu = grad.data() + static_cast<size_t>(edges[e].u) * D;
        double* gv = grad.data() + static_cast<size_t>(edges[e].v) * D;
        for (uint32_t t = 0; t < D; ++t) {
            double diff = static_cast<double>(xu[t]) - static_cast<double>(xv[t]);
            gu[t] += coeff * diff;
            gv[t] -= coeff * diff;
        }
    }
    return grad;
}

// Scatter a point gradient back into the tensor's channel-major layout.
// Coordinate channels are constants and get dropped; masked voxels get zero.
inline std::vector<float> scatter_to_embedding(const FlatPoints& flat,
                                               std::span<const double> point_grad,
                                               const EmbeddingTensor& tensor) {
    const size_t V = tensor.num_voxels();
    const uint32_t D = flat.store.dim;
    std::vector<float> grad(V * tensor.channels, 0.0f);

    for (uint32_t p = 0; p < flat.store.N; ++p) {
        const size_t vox = flat.point_to_voxel[p];
        for (uint32_t c = 0; c < flat.embedding_channels; ++c) {
            grad[c * V + vox] = static_cast<float>(point_grad[static_cast<size_t>(p) * D + c]);
        }
    }
    return grad;
}

} // namespace adapter
} // namespace umloss
