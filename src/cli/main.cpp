#include "umloss/api.hpp"
#include "umloss/cli/args.hpp"
#include "umloss/io/reader.hpp"
#include "umloss/io/writer.hpp"
#include <chrono>
#include <iostream>

using namespace umloss;

namespace {

long long elapsed_ms(std::chrono::high_resolution_clock::time_point since) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        cli::Config cfg = cli::parse_args(argc, argv);

        std::cout << "=== Ultrametric Loss ===\n";
        std::cout << "Input: " << cfg.input_path << ", labels: " << cfg.labels_path << "\n";
        std::cout << "N: " << cfg.N << ", D: " << cfg.D << "\n";
        std::cout << "Output: " << cfg.output_path << "\n";
        std::cout << "alpha: " << cfg.alpha << ", mode: " << (cfg.pretrain ? "pretrain" : "full");
        if (cfg.pretrain) {
            std::cout << (cfg.balance ? " (balanced)" : " (unbalanced)");
        }
        std::cout << "\n\n";

        auto start_time = std::chrono::high_resolution_clock::now();

        // Load data
        std::cout << "Loading data...\n";
        auto load_start = std::chrono::high_resolution_clock::now();
        auto loader = io::create_loader(cfg.input_path);
        if (!loader->load(cfg.input_path, cfg.N, cfg.D)) {
            std::cerr << "Error: Failed to load embedding from " << cfg.input_path << "\n";
            return 1;
        }
        std::vector<int64_t> labels;
        if (!io::load_labels(cfg.labels_path, cfg.N, labels)) {
            std::cerr << "Error: Failed to load " << cfg.N << " labels from " << cfg.labels_path << "\n";
            return 1;
        }
        core::PointStore points = core::make_point_store(loader->values(), std::move(labels), cfg.D);
        std::cout << "Data loaded in " << elapsed_ms(load_start) << " ms\n\n";

        loss::LossConfig loss_cfg;
        loss_cfg.alpha = cfg.alpha;
        loss_cfg.mode = cfg.pretrain ? loss::LossMode::PRETRAIN : loss::LossMode::FULL;
        loss_cfg.balance = cfg.balance;
        loss_cfg.num_threads = cfg.num_threads;
        loss_cfg.verbose = cfg.verbose;

        // MST
        std::cout << "Building EMST...\n";
        auto mst_start = std::chrono::high_resolution_clock::now();
        std::vector<graph::Edge> mst = graph::build_mst(points, loss_cfg.num_threads);
        auto [d_min, d_max] = graph::mst_distance_range(mst);
        std::cout << "EMST built in " << elapsed_ms(mst_start) << " ms ("
                  << mst.size() << " edges, min/max ultrametric: "
                  << d_min << "/" << d_max << ")\n\n";

        // Loss
        std::cout << "Computing loss...\n";
        auto loss_start = std::chrono::high_resolution_clock::now();
        loss::LossResult result = loss::compute_loss(mst, points.labels, loss_cfg);
        std::cout << "Loss computed in " << elapsed_ms(loss_start) << " ms\n";
        if (result.degenerate) {
            std::cout << "Fewer than two points, loss is 0 by definition\n";
        }
        std::cout << "loss: " << result.loss << "\n";
        std::cout << "positive pairs: " << static_cast<uint64_t>(result.num_pairs_pos)
                  << ", negative pairs: " << static_cast<uint64_t>(result.num_pairs_neg) << "\n\n";

        // Write output
        std::cout << "Writing output...\n";
        auto write_start = std::chrono::high_resolution_clock::now();
        if (!io::write_loss_report(cfg.output_path, mst, result)) {
            std::cerr << "Error: Failed to write output\n";
            return 1;
        }
        std::cout << "Output written in " << elapsed_ms(write_start) << " ms\n\n";

        std::cout << "Total time: " << elapsed_ms(start_time) << " ms\n";
        std::cout << "=== Done ===\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
