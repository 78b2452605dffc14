#pragma once

#include "../graph/emst.hpp"
#include "../loss/margin_loss.hpp"
#include <boost/filesystem.hpp>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <string>
#include <vector>

namespace umloss {
namespace io {

namespace detail {

inline bool ensure_parent_dir(const std::string& path) {
    boost::filesystem::path parent = boost::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    boost::system::error_code ec;
    boost::filesystem::create_directories(parent, ec);
    return !ec;
}

} // namespace detail

// One row per MST edge: u,v,distance,num_pos,num_neg,ratio_pos,ratio_neg,gradient
// (result may be degenerate, then only the header is written)
inline bool write_edges_csv(const std::string& path,
                            const std::vector<graph::Edge>& edges,
                            const loss::LossResult& result) {
    if (!detail::ensure_parent_dir(path)) {
        return false;
    }
    if (!result.degenerate && result.gradient.size() != edges.size()) {
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "u,v,distance,num_pos,num_neg,ratio_pos,ratio_neg,gradient\n";
    file << std::setprecision(9);
    for (size_t e = 0; e < edges.size() && !result.degenerate; ++e) {
        file << edges[e].u << "," << edges[e].v << "," << edges[e].distance << ","
             << result.num_pos[e] << "," << result.num_neg[e] << ","
             << result.ratio_pos[e] << "," << result.ratio_neg[e] << ","
             << result.gradient[e] << "\n";
    }
    return file.good();
}

// key=value lines: loss, pair totals, edge count, distance range
inline bool write_summary(const std::string& path,
                          const std::vector<graph::Edge>& edges,
                          const loss::LossResult& result) {
    if (!detail::ensure_parent_dir(path)) {
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        return false;
    }

    auto [d_min, d_max] = graph::mst_distance_range(edges);
    file << std::setprecision(12);
    file << "loss=" << result.loss << "\n";
    file << "num_pairs_pos=" << static_cast<uint64_t>(result.num_pairs_pos) << "\n";
    file << "num_pairs_neg=" << static_cast<uint64_t>(result.num_pairs_neg) << "\n";
    file << "num_edges=" << edges.size() << "\n";
    file << "min_distance=" << d_min << "\n";
    file << "max_distance=" << d_max << "\n";
    file << "degenerate=" << (result.degenerate ? 1 : 0) << "\n";
    return file.good();
}

// Writes <base>.edges.csv and <base>.summary.txt
inline bool write_loss_report(const std::string& base_path,
                              const std::vector<graph::Edge>& edges,
                              const loss::LossResult& result) {
    return write_edges_csv(base_path + ".edges.csv", edges, result) &&
           write_summary(base_path + ".summary.txt", edges, result);
}

} // namespace io
} // namespace umloss
