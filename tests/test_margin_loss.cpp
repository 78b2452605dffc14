#include <catch2/catch.hpp>
#include "umloss/graph/emst.hpp"
#include "umloss/loss/margin_loss.hpp"
#include "umloss/math/rng.hpp"
#include <cmath>
#include <limits>
#include <vector>

namespace {

using umloss::loss::LossConfig;
using umloss::loss::LossMode;

std::vector<umloss::graph::Edge> two_pairs_mst() {
    return {{0, 1, 1.0}, {2, 3, 1.0}, {0, 2, 5.0}};
}

const std::vector<int64_t> two_pairs_labels = {1, 1, 2, 2};

bool approx_equal(double a, double b, double tol = 1e-5) {
    return std::abs(a - b) <= tol * std::max(1.0, std::abs(b));
}

// Direct double sum over all edge combinations
double reference_loss(const std::vector<double>& d,
                      const std::vector<uint64_t>& pos,
                      const std::vector<uint64_t>& neg,
                      double alpha) {
    double loss = 0.0;
    for (size_t i = 0; i < d.size(); ++i) {
        for (size_t j = 0; j < d.size(); ++j) {
            loss += static_cast<double>(pos[i] * neg[j]) * umloss::squared_hinge(d[j] - d[i] + alpha);
        }
    }
    return loss;
}

} // namespace

TEST_CASE("Full loss of two labelled pairs", "[loss]") {
    LossConfig cfg;
    cfg.alpha = 0.1;

    auto result = umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg);

    REQUIRE_FALSE(result.degenerate);
    REQUIRE(result.num_pairs_pos == 2.0);
    REQUIRE(result.num_pairs_neg == 4.0);
    REQUIRE(result.ratio_neg == std::vector<float>{0.0f, 0.0f, 1.0f});
    REQUIRE(result.ratio_pos == std::vector<float>{0.5f, 0.5f, 0.0f});

    // both positive edges sit 4.1 below the negative one
    REQUIRE(approx_equal(result.loss, 2.0 * 4.0 * 4.1 * 4.1));
    REQUIRE(result.gradient.size() == 3);
    REQUIRE(approx_equal(result.gradient[0], -2.0 * 4.0 * 4.1));
    REQUIRE(approx_equal(result.gradient[1], -2.0 * 4.0 * 4.1));
    REQUIRE(approx_equal(result.gradient[2], 2.0 * 4.0 * 8.2));
}

TEST_CASE("Full loss matches the direct double sum", "[loss]") {
    umloss::Rng rng = umloss::RngManager::create_rng(5);
    const uint32_t N = 150;
    auto X = umloss::RngManager::uniform_points(rng, N, 4);
    auto labels = umloss::RngManager::random_labels(rng, N, 3);
    auto store = umloss::core::make_point_store(X, labels, 4);
    auto edges = umloss::graph::build_mst(store, 1);

    LossConfig cfg;
    cfg.alpha = 0.2;
    auto result = umloss::loss::compute_loss(edges, labels, cfg);

    auto d = umloss::graph::edge_distances(edges);
    REQUIRE(approx_equal(result.loss, reference_loss(d, result.num_pos, result.num_neg, cfg.alpha), 1e-9));
}

TEST_CASE("Full loss gradient matches finite differences", "[loss]") {
    // distances 0.05 apart, alpha chosen so no hinge sits exactly on its kink
    const size_t M = 12;
    std::vector<double> d(M);
    for (size_t i = 0; i < M; ++i) {
        d[i] = 0.1 + 0.05 * static_cast<double>(i);
    }
    std::vector<uint64_t> pos = {3, 0, 1, 2, 0, 5, 1, 0, 2, 0, 1, 4};
    std::vector<uint64_t> neg = {0, 2, 1, 0, 3, 1, 0, 6, 2, 1, 0, 3};
    const double alpha = 0.33;

    std::vector<double> grad(M);
    double loss = umloss::loss::full_margin_loss(d, pos, neg, alpha, grad, 1);
    REQUIRE(approx_equal(loss, reference_loss(d, pos, neg, alpha), 1e-12));

    const double eps = 1e-6;
    std::vector<double> scratch(M);
    for (size_t i = 0; i < M; ++i) {
        auto d_plus = d;
        auto d_minus = d;
        d_plus[i] += eps;
        d_minus[i] -= eps;
        double l_plus = umloss::loss::full_margin_loss(d_plus, pos, neg, alpha, scratch, 1);
        double l_minus = umloss::loss::full_margin_loss(d_minus, pos, neg, alpha, scratch, 1);
        double numeric = (l_plus - l_minus) / (2.0 * eps);
        REQUIRE(approx_equal(grad[i], numeric, 1e-5));
    }
}

TEST_CASE("Edge with both pair types gets no self gradient", "[loss]") {
    std::vector<double> d = {1.0};
    std::vector<uint64_t> pos = {2};
    std::vector<uint64_t> neg = {3};
    std::vector<double> grad(1);

    double loss = umloss::loss::full_margin_loss(d, pos, neg, 0.5, grad, 1);
    REQUIRE(loss == 2.0 * 3.0 * 0.25);
    REQUIRE(grad[0] == 0.0);
}

TEST_CASE("Single label gives zero loss", "[loss]") {
    std::vector<umloss::graph::Edge> edges = {{0, 1, 0.2}, {1, 2, 0.3}, {0, 3, 0.9}};
    std::vector<int64_t> labels = {3, 3, 3, 3};

    auto result = umloss::loss::compute_loss(edges, labels);
    REQUIRE(result.num_pairs_neg == 0.0);
    REQUIRE(result.num_pairs_pos == 6.0);
    REQUIRE(result.loss == 0.0);
    REQUIRE(result.gradient == std::vector<float>(3, 0.0f));
}

TEST_CASE("Single point is degenerate, not an error", "[loss]") {
    std::vector<int64_t> labels = {8};
    auto result = umloss::loss::compute_loss({}, labels);

    REQUIRE(result.degenerate);
    REQUIRE(result.loss == 0.0);
    REQUIRE(result.gradient.empty());
    REQUIRE(result.ratio_pos.empty());
    REQUIRE(result.ratio_neg.empty());
    REQUIRE(result.num_pairs_pos == 0.0);
    REQUIRE(result.num_pairs_neg == 0.0);
}

TEST_CASE("Pretrain loss", "[loss]") {
    LossConfig cfg;
    cfg.mode = LossMode::PRETRAIN;
    cfg.alpha = 6.0;   // negative edge at 5 is 1 inside the margin

    SECTION("balanced sums both classes") {
        cfg.balance = true;
        auto result = umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg);
        REQUIRE(approx_equal(result.loss, 2.0));
        REQUIRE(approx_equal(result.gradient[0], 1.0));
        REQUIRE(approx_equal(result.gradient[1], 1.0));
        REQUIRE(approx_equal(result.gradient[2], -2.0));
    }

    SECTION("unbalanced weighs by pair counts") {
        auto result = umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg);
        // (1 * 2 + 1 * 4) / 6
        REQUIRE(approx_equal(result.loss, 1.0));
        REQUIRE(approx_equal(result.gradient[0], 1.0 / 3.0));
        REQUIRE(approx_equal(result.gradient[1], 1.0 / 3.0));
        REQUIRE(approx_equal(result.gradient[2], -4.0 / 3.0));
    }

    SECTION("negatives beyond the margin only pull positives") {
        cfg.alpha = 2.0;
        cfg.balance = true;
        auto result = umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg);
        REQUIRE(approx_equal(result.loss, 1.0));
        REQUIRE(result.gradient[2] == 0.0f);
    }
}

TEST_CASE("Pretrain gradient matches finite differences", "[loss]") {
    umloss::loss::PairCounts counts;
    counts.num_pos = {2, 0, 1, 3};
    counts.num_neg = {0, 4, 1, 2};
    counts.num_pairs_pos = 6;
    counts.num_pairs_neg = 7;
    for (size_t e = 0; e < 4; ++e) {
        counts.ratio_pos.push_back(counts.num_pos[e] / 6.0);
        counts.ratio_neg.push_back(counts.num_neg[e] / 7.0);
    }
    std::vector<double> d = {0.2, 0.45, 0.7, 1.3};

    for (bool balance : {false, true}) {
        std::vector<double> grad(4);
        std::vector<double> scratch(4);
        umloss::loss::pretrain_margin_loss(d, counts, 1.0, balance, grad);

        const double eps = 1e-6;
        for (size_t i = 0; i < d.size(); ++i) {
            auto d_plus = d;
            auto d_minus = d;
            d_plus[i] += eps;
            d_minus[i] -= eps;
            double numeric = (umloss::loss::pretrain_margin_loss(d_plus, counts, 1.0, balance, scratch) -
                              umloss::loss::pretrain_margin_loss(d_minus, counts, 1.0, balance, scratch)) /
                             (2.0 * eps);
            REQUIRE(approx_equal(grad[i], numeric, 1e-6));
        }
    }
}

TEST_CASE("Gradient call agrees with loss call", "[loss]") {
    LossConfig cfg;
    cfg.alpha = 0.5;
    auto result = umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg);
    auto gradient = umloss::loss::compute_gradient(two_pairs_mst(), two_pairs_labels, cfg);
    REQUIRE(gradient == result.gradient);
}

TEST_CASE("Loss is bit-identical across calls and thread counts", "[loss]") {
    umloss::Rng rng = umloss::RngManager::create_rng(2024);
    const uint32_t N = 2600;
    auto X = umloss::RngManager::uniform_points(rng, N, 3);
    auto labels = umloss::RngManager::random_labels(rng, N, 6);
    auto store = umloss::core::make_point_store(X, labels, 3);
    auto edges = umloss::graph::build_mst(store, 1);
    REQUIRE(edges.size() >= umloss::loss::kParallelLossThreshold);

    LossConfig serial;
    serial.alpha = 0.05;
    serial.num_threads = 1;
    LossConfig parallel = serial;
    parallel.num_threads = 4;

    auto a = umloss::loss::compute_loss(edges, labels, serial);
    auto b = umloss::loss::compute_loss(edges, labels, serial);
    auto c = umloss::loss::compute_loss(edges, labels, parallel);

    REQUIRE(a.loss == b.loss);
    REQUIRE(a.loss == c.loss);
    REQUIRE(a.gradient == b.gradient);
    REQUIRE(a.gradient == c.gradient);
    REQUIRE(a.ratio_pos == c.ratio_pos);
    REQUIRE(a.ratio_neg == c.ratio_neg);
}

TEST_CASE("Loss rejects bad alpha", "[loss]") {
    LossConfig cfg;
    cfg.alpha = -0.1;
    REQUIRE_THROWS_AS(umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg),
                      umloss::core::InvalidInput);

    cfg.alpha = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(umloss::loss::compute_loss(two_pairs_mst(), two_pairs_labels, cfg),
                      umloss::core::InvalidInput);

    cfg.alpha = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(umloss::loss::compute_gradient(two_pairs_mst(), two_pairs_labels, cfg),
                      umloss::core::InvalidInput);

    // label count does not match the tree
    cfg.alpha = 0.1;
    std::vector<int64_t> short_labels = {1, 1, 2};
    REQUIRE_THROWS_AS(umloss::loss::compute_loss(two_pairs_mst(), short_labels, cfg),
                      umloss::core::InvalidInput);
}
