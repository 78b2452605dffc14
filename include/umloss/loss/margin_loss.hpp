#pragma once

#include "pair_counter.hpp"
#include "../core/errors.hpp"
#include "../graph/emst.hpp"
#include "../math/kernels.hpp"
#include "../util/thread_pool.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace umloss {
namespace loss {

enum class LossMode {
    FULL,      // quadruplet loss over all positive/negative pair combinations
    PRETRAIN   // pairwise warm-start loss, no positive/negative cross term
};

struct LossConfig {
    double alpha = 0.1;            // margin
    LossMode mode = LossMode::FULL;
    bool balance = false;          // pretrain only: weigh both classes equally
    uint32_t num_threads = 0;      // 0 = auto-detect
    bool verbose = false;
};

struct LossResult {
    double loss = 0.0;
    std::vector<float> gradient;   // dloss/ddistance per MST edge
    std::vector<float> ratio_pos;
    std::vector<float> ratio_neg;
    std::vector<uint64_t> num_pos; // pairs each edge is the bottleneck of
    std::vector<uint64_t> num_neg;
    double num_pairs_pos = 0.0;
    double num_pairs_neg = 0.0;
    // fewer than two points: loss is 0 and all per-edge vectors are empty
    bool degenerate = false;
};

// Below this many edges the full-mode sum runs on the calling thread
constexpr size_t kParallelLossThreshold = 2048;

inline void validate_alpha(double alpha) {
    if (!std::isfinite(alpha) || alpha < 0.0) {
        throw core::InvalidInput("alpha must be finite and non-negative, got " + std::to_string(alpha));
    }
}

namespace detail {

// Run fn(begin, end) over chunks of [0, count) on a boost::asio pool
template<typename F>
void for_each_chunk(size_t count, uint32_t num_threads, F&& fn) {
    if (count == 0) {
        return;
    }
    num_threads = util::resolve_num_threads(num_threads);
    if (num_threads <= 1) {
        fn(size_t(0), count);
        return;
    }

    boost::asio::thread_pool pool(num_threads);
    const size_t chunk_size = std::max<size_t>(1, count / (num_threads * 4));
    for (size_t chunk_start = 0; chunk_start < count; chunk_start += chunk_size) {
        size_t chunk_end = std::min(chunk_start + chunk_size, count);
        boost::asio::post(pool, [&fn, chunk_start, chunk_end]() {
            fn(chunk_start, chunk_end);
        });
    }
    pool.join();
}

} // namespace detail

// Full quadruplet loss
//   L = sum_i sum_j pos_i * neg_j * max(0, d_j - d_i + alpha)^2
// collapsed over edges; distances must be sorted ascending. Writes dL/dd into
// gradient (same length as distances) and returns L.
inline double full_margin_loss(std::span<const double> distances,
                               std::span<const uint64_t> num_pos,
                               std::span<const uint64_t> num_neg,
                               double alpha,
                               std::span<double> gradient,
                               uint32_t num_threads = 0) {
    const size_t M = distances.size();
    if (M < kParallelLossThreshold) {
        num_threads = 1;
    }

    std::vector<size_t> pos_edges;
    std::vector<size_t> neg_edges;
    std::vector<double> neg_dist;
    for (size_t e = 0; e < M; ++e) {
        if (num_pos[e] > 0) pos_edges.push_back(e);
        if (num_neg[e] > 0) {
            neg_edges.push_back(e);
            neg_dist.push_back(distances[e]);
        }
    }

    std::vector<double> loss_part(pos_edges.size(), 0.0);
    std::vector<double> grad_pos(pos_edges.size(), 0.0);
    std::vector<double> grad_neg(neg_edges.size(), 0.0);

    // Positive role: hinge d_j - d_i + alpha grows with j, so skip the prefix
    // of negative edges where it is not positive.
    detail::for_each_chunk(pos_edges.size(), num_threads, [&](size_t begin, size_t end) {
        for (size_t p = begin; p < end; ++p) {
            const double d_i = distances[pos_edges[p]];
            auto first = std::partition_point(neg_dist.begin(), neg_dist.end(),
                                              [&](double d_j) { return d_j - d_i + alpha <= 0.0; });
            double sum_sq = 0.0;
            double sum_lin = 0.0;
            for (auto it = first; it != neg_dist.end(); ++it) {
                const size_t n = static_cast<size_t>(it - neg_dist.begin());
                const double w = static_cast<double>(num_neg[neg_edges[n]]);
                const double h = *it - d_i + alpha;
                sum_sq += w * h * h;
                sum_lin += w * h;
            }
            const double w_i = static_cast<double>(num_pos[pos_edges[p]]);
            loss_part[p] = w_i * sum_sq;
            grad_pos[p] = -2.0 * w_i * sum_lin;
        }
    });

    // Negative role: hinge d_j - d_i + alpha shrinks with i, stop once it
    // reaches zero.
    detail::for_each_chunk(neg_edges.size(), num_threads, [&](size_t begin, size_t end) {
        for (size_t n = begin; n < end; ++n) {
            const double d_j = distances[neg_edges[n]];
            double sum_lin = 0.0;
            for (size_t i : pos_edges) {
                const double h = d_j - distances[i] + alpha;
                if (h <= 0.0) break;
                sum_lin += static_cast<double>(num_pos[i]) * h;
            }
            grad_neg[n] = 2.0 * static_cast<double>(num_neg[neg_edges[n]]) * sum_lin;
        }
    });

    std::fill(gradient.begin(), gradient.end(), 0.0);
    double loss = 0.0;
    for (size_t p = 0; p < pos_edges.size(); ++p) {
        loss += loss_part[p];
        gradient[pos_edges[p]] += grad_pos[p];
    }
    for (size_t n = 0; n < neg_edges.size(); ++n) {
        gradient[neg_edges[n]] += grad_neg[n];
    }
    return loss;
}

// Pairwise warm-start loss
//   pos edge: d^2 * ratio_pos, neg edge: max(0, alpha - d)^2 * ratio_neg
// balanced:   sum of both
// unbalanced: ratios de-normalised by the pair totals, divided by all pairs
inline double pretrain_margin_loss(std::span<const double> distances,
                                   const PairCounts& counts,
                                   double alpha,
                                   bool balance,
                                   std::span<double> gradient) {
    const size_t M = distances.size();
    const double P = static_cast<double>(counts.num_pairs_pos);
    const double Q = static_cast<double>(counts.num_pairs_neg);

    double sum_pos = 0.0;
    double sum_neg = 0.0;
    std::vector<double> dpos(M, 0.0);
    std::vector<double> dneg(M, 0.0);
    for (size_t e = 0; e < M; ++e) {
        const double d = distances[e];
        const double h = std::max(0.0, alpha - d);
        sum_pos += d * d * counts.ratio_pos[e];
        sum_neg += h * h * counts.ratio_neg[e];
        dpos[e] = 2.0 * d * counts.ratio_pos[e];
        dneg[e] = -2.0 * h * counts.ratio_neg[e];
    }

    if (balance) {
        for (size_t e = 0; e < M; ++e) {
            gradient[e] = dpos[e] + dneg[e];
        }
        return sum_pos + sum_neg;
    }

    if (P + Q == 0.0) {
        std::fill(gradient.begin(), gradient.end(), 0.0);
        return 0.0;
    }
    for (size_t e = 0; e < M; ++e) {
        gradient[e] = (dpos[e] * P + dneg[e] * Q) / (P + Q);
    }
    return (sum_pos * P + sum_neg * Q) / (P + Q);
}

// Loss from per-edge distances and pair counts, in the mode cfg asks for
inline LossResult margin_loss(std::span<const double> distances,
                              const PairCounts& counts,
                              const LossConfig& cfg) {
    validate_alpha(cfg.alpha);
    const size_t M = distances.size();
    if (counts.num_edges() != M) {
        throw core::InvalidInput("pair counts cover " + std::to_string(counts.num_edges()) +
                                 " edges, distances " + std::to_string(M));
    }

    LossResult result;
    result.num_pairs_pos = static_cast<double>(counts.num_pairs_pos);
    result.num_pairs_neg = static_cast<double>(counts.num_pairs_neg);
    if (M == 0) {
        result.degenerate = true;
        return result;
    }

    std::vector<double> gradient(M, 0.0);
    if (cfg.mode == LossMode::FULL) {
        result.loss = full_margin_loss(distances, counts.num_pos, counts.num_neg,
                                       cfg.alpha, gradient, cfg.num_threads);
    } else {
        result.loss = pretrain_margin_loss(distances, counts, cfg.alpha, cfg.balance, gradient);
    }

    result.gradient.resize(M);
    result.ratio_pos.resize(M);
    result.ratio_neg.resize(M);
    result.num_pos = counts.num_pos;
    result.num_neg = counts.num_neg;
    for (size_t e = 0; e < M; ++e) {
        result.gradient[e] = static_cast<float>(gradient[e]);
        result.ratio_pos[e] = static_cast<float>(counts.ratio_pos[e]);
        result.ratio_neg[e] = static_cast<float>(counts.ratio_neg[e]);
    }

    if (cfg.verbose) {
        std::cout << "um loss: " << result.loss
                  << " (" << counts.num_pairs_pos << " positive / "
                  << counts.num_pairs_neg << " negative pairs)\n";
    }
    return result;
}

// Ultrametric loss over a sorted MST and the labels of the points it spans.
// N == 1 is not an error: the result is flagged degenerate with zero loss.
inline LossResult compute_loss(const std::vector<graph::Edge>& edges,
                               std::span<const int64_t> labels,
                               const LossConfig& cfg = {}) {
    validate_alpha(cfg.alpha);
    PairCounts counts = count_ultrametric_pairs(edges, labels);
    std::vector<double> distances = graph::edge_distances(edges);
    return margin_loss(distances, counts, cfg);
}

// Backward pass, identical to compute_loss(...).gradient
inline std::vector<float> compute_gradient(const std::vector<graph::Edge>& edges,
                                           std::span<const int64_t> labels,
                                           const LossConfig& cfg = {}) {
    return compute_loss(edges, labels, cfg).gradient;
}

} // namespace loss
} // namespace umloss
