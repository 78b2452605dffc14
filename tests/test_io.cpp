#include <catch2/catch.hpp>
#include "umloss/io/reader.hpp"
#include "umloss/io/writer.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("umloss_test_" + name)).string();
}

} // namespace

TEST_CASE("Raw float32 loader", "[io]") {
    const uint32_t N = 50;
    const uint32_t D = 6;
    std::vector<float> data(N * D);
    for (uint32_t i = 0; i < N * D; ++i) {
        data[i] = static_cast<float>(i) * 0.1f;
    }

    std::string test_file = temp_path("data.raw");
    {
        std::ofstream file(test_file, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), N * D * sizeof(float));
    }

    auto loader = umloss::io::create_loader(test_file);
    REQUIRE(loader->load(test_file, N, D));
    REQUIRE(loader->num_rows() == N);
    REQUIRE(loader->num_dims() == D);
    REQUIRE(loader->values() == data);

    auto row = loader->get_row(7);
    REQUIRE(row.size() == D);
    REQUIRE(row[0] == data[7 * D]);
    REQUIRE(loader->get_row(N).empty());

    // asking for more rows than the file holds fails
    REQUIRE_FALSE(loader->load(test_file, N + 1, D));
    REQUIRE_FALSE(loader->load(temp_path("missing.raw"), N, D));

    std::remove(test_file.c_str());
}

TEST_CASE("Fvecs loader", "[io]") {
    const uint32_t N = 4;
    const uint32_t D = 3;
    std::string test_file = temp_path("data.fvecs");
    {
        std::ofstream file(test_file, std::ios::binary);
        for (uint32_t i = 0; i < N; ++i) {
            int32_t d = D;
            file.write(reinterpret_cast<const char*>(&d), sizeof(d));
            float row[3] = {static_cast<float>(i), 1.0f, -1.0f};
            file.write(reinterpret_cast<const char*>(row), sizeof(row));
        }
    }

    auto loader = umloss::io::create_loader(test_file);
    REQUIRE(loader->load(test_file, N, D));
    REQUIRE(loader->get_row(2)[0] == 2.0f);
    REQUIRE(loader->get_row(3)[2] == -1.0f);

    // header dimension mismatch
    REQUIRE_FALSE(loader->load(test_file, N, D + 1));

    std::remove(test_file.c_str());
}

TEST_CASE("Label loaders", "[io]") {
    std::string txt = temp_path("labels.txt");
    {
        std::ofstream file(txt);
        file << "1 1 2\n2 -5\n";
    }
    std::vector<int64_t> labels;
    REQUIRE(umloss::io::load_labels(txt, 5, labels));
    REQUIRE(labels == std::vector<int64_t>{1, 1, 2, 2, -5});
    REQUIRE_FALSE(umloss::io::load_labels(txt, 4, labels));

    {
        std::ofstream file(txt);
        file << "1 2 x\n";
    }
    REQUIRE_FALSE(umloss::io::load_labels(txt, 3, labels));

    std::string raw = temp_path("labels.i64");
    std::vector<int64_t> values = {10, 20, 30};
    {
        std::ofstream file(raw, std::ios::binary);
        file.write(reinterpret_cast<const char*>(values.data()), values.size() * sizeof(int64_t));
    }
    REQUIRE(umloss::io::load_labels(raw, 3, labels));
    REQUIRE(labels == values);
    REQUIRE_FALSE(umloss::io::load_labels(raw, 4, labels));

    std::remove(txt.c_str());
    std::remove(raw.c_str());
}

TEST_CASE("Loss report writer", "[io]") {
    std::vector<umloss::graph::Edge> edges = {{0, 1, 1.0}, {2, 3, 1.0}, {0, 2, 5.0}};
    std::vector<int64_t> labels = {1, 1, 2, 2};
    auto result = umloss::loss::compute_loss(edges, labels);

    auto dir = std::filesystem::temp_directory_path() / "umloss_test_report" / "nested";
    std::filesystem::remove_all(dir.parent_path());
    std::string base = (dir / "run").string();

    REQUIRE(umloss::io::write_loss_report(base, edges, result));

    std::ifstream csv(base + ".edges.csv");
    REQUIRE(csv.good());
    std::string line;
    std::getline(csv, line);
    REQUIRE(line == "u,v,distance,num_pos,num_neg,ratio_pos,ratio_neg,gradient");
    std::getline(csv, line);
    REQUIRE(line.rfind("0,1,1,1,0,0.5,0,", 0) == 0);
    std::getline(csv, line);
    std::getline(csv, line);
    REQUIRE(line.rfind("0,2,5,0,4,0,1,", 0) == 0);
    REQUIRE_FALSE(std::getline(csv, line));

    std::ifstream summary(base + ".summary.txt");
    std::getline(summary, line);
    REQUIRE(line.rfind("loss=", 0) == 0);
    std::getline(summary, line);
    REQUIRE(line == "num_pairs_pos=2");
    std::getline(summary, line);
    REQUIRE(line == "num_pairs_neg=4");
    std::getline(summary, line);
    REQUIRE(line == "num_edges=3");

    csv.close();
    summary.close();
    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("Writer refuses mismatched results", "[io]") {
    std::vector<umloss::graph::Edge> edges = {{0, 1, 1.0}};
    umloss::loss::LossResult result;   // no gradient for the edge
    REQUIRE_FALSE(umloss::io::write_edges_csv(temp_path("bad.csv"), edges, result));
}
