#pragma once

#include <boost/pending/disjoint_sets.hpp>
#include <cstdint>
#include <vector>

namespace umloss {
namespace graph {

// Index-based disjoint sets over [0, n), tracking the size of every root
class DisjointSets {
private:
    std::vector<uint32_t> rank_;
    std::vector<uint32_t> parent_;
    std::vector<uint32_t> size_;
    boost::disjoint_sets<uint32_t*, uint32_t*> sets_;

public:
    explicit DisjointSets(uint32_t n)
        : rank_(n, 0), parent_(n, 0), size_(n, 1),
          sets_(rank_.data(), parent_.data()) {
        for (uint32_t i = 0; i < n; ++i) {
            sets_.make_set(i);
        }
    }

    // rank_/parent_ are referenced by pointer from sets_
    DisjointSets(const DisjointSets&) = delete;
    DisjointSets& operator=(const DisjointSets&) = delete;

    uint32_t find(uint32_t x) {
        return sets_.find_set(x);
    }

    // Merge the sets rooted at root_a and root_b, return the surviving root
    uint32_t link_roots(uint32_t root_a, uint32_t root_b) {
        if (root_a == root_b) {
            return root_a;
        }
        sets_.link(root_a, root_b);
        uint32_t root = sets_.find_set(root_a);
        size_[root] = size_[root_a] + size_[root_b];
        return root;
    }

    uint32_t unite(uint32_t a, uint32_t b) {
        return link_roots(find(a), find(b));
    }

    uint32_t size_of_root(uint32_t root) const {
        return size_[root];
    }

    uint32_t num_elements() const {
        return static_cast<uint32_t>(size_.size());
    }
};

} // namespace graph
} // namespace umloss
