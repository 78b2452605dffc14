#pragma once

#include "umloss/adapter/embedding_adapter.hpp"
#include "umloss/core/point_store.hpp"
#include "umloss/graph/emst.hpp"
#include "umloss/loss/margin_loss.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace umloss {

struct UltrametricConfig {
    loss::LossConfig loss;
    adapter::AdapterConfig adapter;
};

struct UltrametricOutput {
    loss::LossResult result;
    std::vector<graph::Edge> mst;      // sorted by (distance, u, v)
    std::vector<float> gradient;       // dloss/dfeature, layout of the input
};

// Loss over a plain point set. gradient is N * dim, row-major.
UltrametricOutput ultrametric_loss(const core::PointStore& points,
                                   const loss::LossConfig& cfg = {});

// Loss over a channel-major (k, d, h, w) embedding with per-voxel labels and
// an optional mask (empty = keep all). gradient has the tensor's layout.
UltrametricOutput ultrametric_loss(const adapter::EmbeddingTensor& embedding,
                                   std::span<const int64_t> labels,
                                   std::span<const uint8_t> mask,
                                   const UltrametricConfig& cfg = {});

} // namespace umloss
