#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace umloss {
namespace io {

// Embedding loader interface
class DataLoader {
public:
    virtual ~DataLoader() = default;
    virtual bool load(const std::string& path, uint32_t N, uint32_t D) = 0;

    std::span<const float> get_row(uint32_t idx) const {
        if (idx >= N_) {
            return std::span<const float>();
        }
        return std::span<const float>(data_.data() + static_cast<size_t>(idx) * D_, D_);
    }

    const std::vector<float>& values() const { return data_; }
    uint32_t num_rows() const { return N_; }
    uint32_t num_dims() const { return D_; }

protected:
    std::vector<float> data_;
    uint32_t N_ = 0;
    uint32_t D_ = 0;
};

// Raw float32 row-major loader
class RawFloat32Loader : public DataLoader {
public:
    bool load(const std::string& path, uint32_t N, uint32_t D) override {
        N_ = N;
        D_ = D;
        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }

        const size_t total_floats = static_cast<size_t>(N) * D;
        data_.resize(total_floats);
        file.read(reinterpret_cast<char*>(data_.data()), total_floats * sizeof(float));
        return file.good();
    }
};

// .fvecs loader (FAISS style): per row an int32 dimension, then the floats
class FvecsLoader : public DataLoader {
public:
    bool load(const std::string& path, uint32_t N, uint32_t D) override {
        N_ = N;
        D_ = D;
        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }

        data_.clear();
        data_.reserve(static_cast<size_t>(N) * D);
        std::vector<float> row(D);
        for (uint32_t i = 0; i < N; ++i) {
            int32_t d = 0;
            file.read(reinterpret_cast<char*>(&d), sizeof(int32_t));
            if (!file || static_cast<uint32_t>(d) != D) {
                return false;
            }

            file.read(reinterpret_cast<char*>(row.data()), D * sizeof(float));
            if (!file) {
                return false;
            }
            data_.insert(data_.end(), row.begin(), row.end());
        }
        return true;
    }
};

inline std::unique_ptr<DataLoader> create_loader(const std::string& path) {
    if (std::filesystem::path(path).extension() == ".fvecs") {
        return std::make_unique<FvecsLoader>();
    }
    return std::make_unique<RawFloat32Loader>();
}

// Labels: whitespace separated integers for .txt, raw int64 otherwise.
// Fails unless exactly N labels are read.
inline bool load_labels(const std::string& path, uint32_t N, std::vector<int64_t>& labels) {
    if (!std::filesystem::exists(path)) {
        return false;
    }

    labels.clear();
    if (std::filesystem::path(path).extension() == ".txt") {
        std::ifstream file(path);
        if (!file) {
            return false;
        }
        int64_t label = 0;
        while (file >> label) {
            labels.push_back(label);
        }
        if (!file.eof()) {
            return false;   // stopped on something that is not a number
        }
        return labels.size() == N;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    labels.resize(N);
    file.read(reinterpret_cast<char*>(labels.data()), static_cast<std::streamsize>(N) * sizeof(int64_t));
    return file.good();
}

} // namespace io
} // namespace umloss
