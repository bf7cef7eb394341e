#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "kestrel/types.hpp"

namespace example_factory {

// Gaussian vector, reproducible per seed.
inline std::vector<float> random_vector(std::size_t dim, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<float> nd(0.0f, 1.0f);
    std::vector<float> v(dim);
    for (auto& x : v) x = nd(rng);
    return v;
}

// n vectors of length dim packed row-major.
inline std::vector<float> random_rows(std::size_t n, std::size_t dim, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<float> nd(0.0f, 1.0f);
    std::vector<float> v(n * dim);
    for (auto& x : v) x = nd(rng);
    return v;
}

// Valid example whose feature vectors have length dim.
inline kestrel::TrainingExample make_example(kestrel::entity_id user, kestrel::entity_id item,
                                             float label, std::size_t dim,
                                             std::uint64_t seed = 1) {
    kestrel::TrainingExample ex;
    ex.user_id = user;
    ex.item_id = item;
    ex.label = label;
    ex.user_features = random_vector(dim, seed * 1315423911ull + user);
    ex.item_features = random_vector(dim, seed * 2654435761ull + item);
    ex.timestamp = std::chrono::system_clock::now();
    return ex;
}

// Unique empty directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<std::uint64_t> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("kestrel_" + tag + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Sets (or unsets) an environment variable and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) previous_ = std::string(old);
        if (value) ::setenv(name, value, 1); else ::unsetenv(name);
    }
    ~ScopedEnv() {
        if (previous_) ::setenv(name_.c_str(), previous_->c_str(), 1);
        else ::unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace example_factory
