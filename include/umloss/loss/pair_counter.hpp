#pragma once

#include "../core/errors.hpp"
#include "../graph/emst.hpp"
#include "../graph/union_find.hpp"
#include <cmath>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace umloss {
namespace loss {

// label -> number of points of that label in a cluster
using LabelHistogram = std::unordered_map<int64_t, uint64_t>;

// Positive/negative pairs whose bottleneck is each MST edge
struct PairCounts {
    std::vector<uint64_t> num_pos;   // per edge
    std::vector<uint64_t> num_neg;   // per edge
    std::vector<double> ratio_pos;   // num_pos / num_pairs_pos
    std::vector<double> ratio_neg;   // num_neg / num_pairs_neg
    uint64_t num_pairs_pos = 0;
    uint64_t num_pairs_neg = 0;

    size_t num_edges() const {
        return num_pos.size();
    }
};

// Edges must reference points in [0, num_points), be loop-free and sorted by
// non-decreasing distance.
inline void validate_edges(const std::vector<graph::Edge>& edges, size_t num_points) {
    if (num_points == 0) {
        throw core::InvalidInput("empty point set");
    }
    if (edges.size() != num_points - 1) {
        throw core::InvalidInput("expected " + std::to_string(num_points - 1) +
                                 " MST edges for " + std::to_string(num_points) +
                                 " points, got " + std::to_string(edges.size()));
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        const graph::Edge& e = edges[i];
        if (e.u >= num_points || e.v >= num_points) {
            throw core::InvalidInput("edge " + std::to_string(i) + " references a point out of range");
        }
        if (e.u == e.v) {
            throw core::InvalidInput("edge " + std::to_string(i) + " is a self-loop");
        }
        if (!std::isfinite(e.distance) || e.distance < 0.0) {
            throw core::InvalidInput("edge " + std::to_string(i) + " has an invalid distance");
        }
        if (i > 0 && e.distance < edges[i - 1].distance) {
            throw core::InvalidInput("edges are not sorted by distance");
        }
    }
}

// Number of same-label pairs between two clusters
inline uint64_t count_matching_pairs(const LabelHistogram& a, const LabelHistogram& b) {
    const LabelHistogram& small = a.size() <= b.size() ? a : b;
    const LabelHistogram& large = a.size() <= b.size() ? b : a;
    uint64_t matches = 0;
    for (const auto& [label, count] : small) {
        auto it = large.find(label);
        if (it != large.end()) {
            matches += count * it->second;
        }
    }
    return matches;
}

// Walk the sorted MST Kruskal-style: the pairs an edge merges are exactly the
// pairs it is the bottleneck of.
inline PairCounts count_ultrametric_pairs(const std::vector<graph::Edge>& edges,
                                          std::span<const int64_t> labels) {
    validate_edges(edges, labels.size());

    const uint32_t N = static_cast<uint32_t>(labels.size());
    const size_t M = edges.size();

    PairCounts counts;
    counts.num_pos.assign(M, 0);
    counts.num_neg.assign(M, 0);
    counts.ratio_pos.assign(M, 0.0);
    counts.ratio_neg.assign(M, 0.0);

    graph::DisjointSets clusters(N);
    std::vector<LabelHistogram> histograms(N);
    for (uint32_t i = 0; i < N; ++i) {
        histograms[i][labels[i]] = 1;
    }

    for (size_t i = 0; i < M; ++i) {
        uint32_t root_u = clusters.find(edges[i].u);
        uint32_t root_v = clusters.find(edges[i].v);
        if (root_u == root_v) {
            throw core::InvalidInput("edge " + std::to_string(i) + " closes a cycle, edges do not form a tree");
        }

        uint64_t size_u = clusters.size_of_root(root_u);
        uint64_t size_v = clusters.size_of_root(root_v);

        uint64_t pos = count_matching_pairs(histograms[root_u], histograms[root_v]);
        counts.num_pos[i] = pos;
        counts.num_neg[i] = size_u * size_v - pos;
        counts.num_pairs_pos += pos;
        counts.num_pairs_neg += size_u * size_v - pos;

        uint32_t root = clusters.link_roots(root_u, root_v);
        uint32_t absorbed = root == root_u ? root_v : root_u;

        // small-to-large: the root keeps the bigger histogram
        LabelHistogram& kept = histograms[root];
        LabelHistogram& gone = histograms[absorbed];
        if (kept.size() < gone.size()) {
            std::swap(kept, gone);
        }
        for (const auto& [label, count] : gone) {
            kept[label] += count;
        }
        LabelHistogram().swap(gone);
    }

    for (size_t i = 0; i < M; ++i) {
        if (counts.num_pairs_pos > 0) {
            counts.ratio_pos[i] = static_cast<double>(counts.num_pos[i]) /
                                  static_cast<double>(counts.num_pairs_pos);
        }
        if (counts.num_pairs_neg > 0) {
            counts.ratio_neg[i] = static_cast<double>(counts.num_neg[i]) /
                                  static_cast<double>(counts.num_pairs_neg);
        }
    }

    return counts;
}

} // namespace loss
} // namespace umloss
