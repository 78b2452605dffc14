#pragma once

#include "../core/point_store.hpp"
#include "../math/kernels.hpp"
#include "../util/thread_pool.hpp"
#include <algorithm>
#include <boost/dynamic_bitset.hpp>
#include <cstdint>
#include <limits>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace umloss {
namespace graph {

// MST edge, stored with u < v
struct Edge {
    uint32_t u;
    uint32_t v;
    double distance;
};

// Canonical total order: (distance, u, v)
inline bool edge_less(const Edge& a, const Edge& b) {
    return std::tie(a.distance, a.u, a.v) < std::tie(b.distance, b.u, b.v);
}

inline void sort_edges(std::vector<Edge>& edges) {
    std::sort(edges.begin(), edges.end(), edge_less);
}

// Below this many points Prim's relaxation runs on the calling thread
constexpr uint32_t kParallelMstThreshold = 4096;

namespace detail {

struct Candidate {
    double distance = std::numeric_limits<double>::infinity();
    uint32_t from = UINT32_MAX;
    uint32_t vertex = UINT32_MAX;
};

// Order on candidates matching edge_less on the edge they would add
inline bool candidate_less(const Candidate& a, const Candidate& b) {
    if (a.vertex == UINT32_MAX) return false;
    if (b.vertex == UINT32_MAX) return true;
    if (a.distance != b.distance) return a.distance < b.distance;
    auto ka = std::minmax(a.from, a.vertex);
    auto kb = std::minmax(b.from, b.vertex);
    return ka < kb;
}

} // namespace detail

// Euclidean minimum spanning tree over all points (dense Prim's).
// Returns N-1 edges sorted by edge_less; throws core::InvalidInput on bad input.
inline std::vector<Edge> build_mst(const core::PointStore& store,
                                   uint32_t num_threads = 0) {
    core::validate(store);

    const uint32_t N = store.N;
    const uint32_t D = store.dim;
    const float* X = store.features.data();

    std::vector<Edge> edges;
    if (N < 2) {
        return edges;
    }
    edges.reserve(N - 1);

    // best_dist[j]: distance from j to the tree, reached through best_from[j]
    std::vector<double> best_dist(N, std::numeric_limits<double>::infinity());
    std::vector<uint32_t> best_from(N, UINT32_MAX);
    boost::dynamic_bitset<> in_tree(N);

    num_threads = util::resolve_num_threads(num_threads);
    std::unique_ptr<util::ThreadPool> pool;
    if (num_threads > 1 && N >= kParallelMstThreshold) {
        pool = std::make_unique<util::ThreadPool>(num_threads);
    }
    std::vector<detail::Candidate> chunk_best(pool ? pool->size() : 1);

    // Relax [begin, end) against the newly added vertex and report the best
    // remaining candidate of the range.
    auto relax = [&](uint32_t chunk, uint32_t begin, uint32_t end, uint32_t current) {
        const float* xc = X + static_cast<size_t>(current) * D;
        detail::Candidate best;
        for (uint32_t j = begin; j < end; ++j) {
            if (in_tree[j]) continue;

            double d = euclidean_distance(xc, X + static_cast<size_t>(j) * D, D);
            // smaller source index wins ties, giving the smaller canonical edge
            if (d < best_dist[j] || (d == best_dist[j] && current < best_from[j])) {
                best_dist[j] = d;
                best_from[j] = current;
            }

            detail::Candidate cand{best_dist[j], best_from[j], j};
            if (detail::candidate_less(cand, best)) {
                best = cand;
            }
        }
        chunk_best[chunk] = best;
    };

    uint32_t current = 0;
    in_tree[current] = true;

    for (uint32_t step = 1; step < N; ++step) {
        std::fill(chunk_best.begin(), chunk_best.end(), detail::Candidate{});

        if (pool) {
            pool->run_chunks(N, [&](uint32_t chunk, uint32_t begin, uint32_t end) {
                relax(chunk, begin, end, current);
            });
        } else {
            relax(0, 0, N, current);
        }

        detail::Candidate next;
        for (const auto& cand : chunk_best) {
            if (detail::candidate_less(cand, next)) {
                next = cand;
            }
        }

        auto [u, v] = std::minmax(next.from, next.vertex);
        edges.push_back(Edge{u, v, next.distance});
        in_tree[next.vertex] = true;
        current = next.vertex;
    }

    sort_edges(edges);
    return edges;
}

inline double mst_total_weight(const std::vector<Edge>& edges) {
    double total = 0.0;
    for (const auto& e : edges) {
        total += e.distance;
    }
    return total;
}

// (min, max) edge distance; (0, 0) for an empty tree
inline std::pair<double, double> mst_distance_range(const std::vector<Edge>& edges) {
    if (edges.empty()) {
        return {0.0, 0.0};
    }
    auto [lo, hi] = std::minmax_element(edges.begin(), edges.end(),
                                        [](const Edge& a, const Edge& b) {
                                            return a.distance < b.distance;
                                        });
    return {lo->distance, hi->distance};
}

inline std::vector<double> edge_distances(const std::vector<Edge>& edges) {
    std::vector<double> d(edges.size());
    for (size_t i = 0; i < edges.size(); ++i) {
        d[i] = edges[i].distance;
    }
    return d;
}

} // namespace graph
} // namespace umloss
