#include "umloss/api.hpp"
#include <iostream>

namespace umloss {

namespace {

std::vector<graph::Edge> build_logged_mst(const core::PointStore& points,
                                          const loss::LossConfig& cfg) {
    std::vector<graph::Edge> mst = graph::build_mst(points, cfg.num_threads);
    if (cfg.verbose) {
        auto [d_min, d_max] = graph::mst_distance_range(mst);
        std::cout << "min/max ultrametric: " << d_min << "/" << d_max << "\n";
    }
    return mst;
}

} // namespace

UltrametricOutput ultrametric_loss(const core::PointStore& points,
                                   const loss::LossConfig& cfg) {
    loss::validate_alpha(cfg.alpha);

    UltrametricOutput out;
    out.mst = build_logged_mst(points, cfg);
    out.result = loss::compute_loss(out.mst, points.labels, cfg);

    std::vector<double> grad = adapter::point_gradient(points, out.mst, out.result.gradient);
    out.gradient.assign(grad.begin(), grad.end());
    return out;
}

UltrametricOutput ultrametric_loss(const adapter::EmbeddingTensor& embedding,
                                   std::span<const int64_t> labels,
                                   std::span<const uint8_t> mask,
                                   const UltrametricConfig& cfg) {
    loss::validate_alpha(cfg.loss.alpha);
    adapter::alpha_too_big(cfg.adapter, embedding.channels, cfg.loss.alpha);

    // 1. One point per (unmasked) voxel, augmented by its coordinates
    adapter::FlatPoints flat = adapter::to_point_store(embedding, labels, mask, cfg.adapter);

    // 2. EMST over the points
    UltrametricOutput out;
    out.mst = build_logged_mst(flat.store, cfg.loss);

    // 3. Loss and gradient on the edge distances
    out.result = loss::compute_loss(out.mst, flat.store.labels, cfg.loss);

    // 4. Back through the edge lengths into the embedding
    std::vector<double> point_grad = adapter::point_gradient(flat.store, out.mst, out.result.gradient);
    out.gradient = adapter::scatter_to_embedding(flat, point_grad, embedding);
    return out;
}

} // namespace umloss
