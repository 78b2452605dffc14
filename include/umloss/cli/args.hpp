#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace umloss {
namespace cli {

struct Config {
    // I/O
    std::string input_path;
    std::string labels_path;
    uint32_t N = 0;
    uint32_t D = 0;
    std::string output_path;

    // Loss
    float alpha = 0.1f;
    bool pretrain = false;
    bool balance = false;   // pretrain only

    // Threading
    uint32_t num_threads = 0;  // 0 = auto-detect

    bool verbose = false;
};

inline void print_usage() {
    std::cout << "Ultrametric loss over an embedding's EMST. Options:\n";
    std::cout << "  --input <path>     Embedding file (.fvecs or raw float32, row-major)\n";
    std::cout << "  --labels <path>    Labels (.txt whitespace separated, or raw int64)\n";
    std::cout << "  --N <num>          Number of points\n";
    std::cout << "  --D <num>          Embedding dimension\n";
    std::cout << "  --out <path>       Output base path (<out>.edges.csv, <out>.summary.txt)\n";
    std::cout << "  --alpha <num>      Margin of the quadruplet loss (default: 0.1)\n";
    std::cout << "  --pretrain         Use the pairwise warm-start loss\n";
    std::cout << "  --balance          Weigh positive and negative pairs equally (pretrain only)\n";
    std::cout << "  --threads <num>    Number of threads, 0 for auto (default: 0)\n";
    std::cout << "  --verbose          Report MST distance range and pair totals\n";
}

// Simple argument parser
inline Config parse_args(int argc, char* argv[]) {
    Config cfg;
    std::map<std::string, std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        }

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args[key] = argv[++i];
            } else {
                args[key] = "1";  // Boolean flag
            }
        } else {
            throw std::runtime_error("Error: unexpected argument '" + arg + "'");
        }
    }

    auto get_str = [&](const std::string& key, const std::string& def = "") {
        auto it = args.find(key);
        return (it != args.end()) ? it->second : def;
    };

    auto get_uint = [&](const std::string& key, uint32_t def = 0) {
        auto it = args.find(key);
        if (it == args.end()) return def;
        return static_cast<uint32_t>(std::stoul(it->second));
    };

    auto get_float = [&](const std::string& key, float def = 0.0f) {
        auto it = args.find(key);
        if (it == args.end()) return def;
        return std::stof(it->second);
    };

    auto get_flag = [&](const std::string& key) {
        auto it = args.find(key);
        return it != args.end() && it->second != "0";
    };

    cfg.input_path = get_str("input");
    cfg.labels_path = get_str("labels");
    cfg.N = get_uint("N");
    cfg.D = get_uint("D");
    cfg.output_path = get_str("out");
    cfg.alpha = get_float("alpha", 0.1f);
    cfg.pretrain = get_flag("pretrain");
    cfg.balance = get_flag("balance");
    cfg.num_threads = get_uint("threads", 0);
    cfg.verbose = get_flag("verbose");

    if (cfg.input_path.empty()) {
        throw std::runtime_error("Error: --input is required");
    }
    if (cfg.labels_path.empty()) {
        throw std::runtime_error("Error: --labels is required");
    }
    if (cfg.N == 0) {
        throw std::runtime_error("Error: --N is required");
    }
    if (cfg.D == 0) {
        throw std::runtime_error("Error: --D is required");
    }
    if (cfg.output_path.empty()) {
        throw std::runtime_error("Error: --out is required");
    }
    if (!std::isfinite(cfg.alpha) || cfg.alpha < 0.0f) {
        throw std::runtime_error("Error: --alpha must be a non-negative number");
    }
    if (cfg.balance && !cfg.pretrain) {
        std::cerr << "Warning: --balance only affects --pretrain, ignoring\n";
    }

    return cfg;
}

} // namespace cli
} // namespace umloss
