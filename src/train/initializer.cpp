#include "kestrel/train/initializer.hpp"

#include <cmath>
#include <string>

#include "kestrel/kernels/distance.hpp"

namespace kestrel::train {

namespace {

auto fill_uniform(std::size_t n, float limit, std::mt19937_64& rng) -> std::vector<float> {
  std::uniform_real_distribution<float> dist(-limit, limit);
  std::vector<float> out(n);
  for (auto& x : out) x = dist(rng);
  return out;
}

auto fill_normal(std::size_t n, float mean, float stddev, std::mt19937_64& rng) -> std::vector<float> {
  std::normal_distribution<float> dist(mean, stddev);
  std::vector<float> out(n);
  for (auto& x : out) x = dist(rng);
  return out;
}

} // namespace

auto initialize_values(const InitSpec& spec, std::size_t n, std::mt19937_64& rng)
    -> std::vector<float> {
  const auto fan = static_cast<float>(n == 0 ? 1 : n);
  switch (spec.method) {
    case InitMethod::xavier_uniform:
    case InitMethod::he_uniform:     return fill_uniform(n, std::sqrt(6.0f / fan), rng);
    case InitMethod::xavier_normal:
    case InitMethod::he_normal:      return fill_normal(n, 0.0f, std::sqrt(2.0f / fan), rng);
    case InitMethod::lecun_uniform:  return fill_uniform(n, std::sqrt(3.0f / fan), rng);
    case InitMethod::lecun_normal:   return fill_normal(n, 0.0f, std::sqrt(1.0f / fan), rng);
    case InitMethod::uniform: {
      std::uniform_real_distribution<float> dist(spec.a, spec.b);
      std::vector<float> out(n);
      for (auto& x : out) x = dist(rng);
      return out;
    }
    case InitMethod::normal:   return fill_normal(n, spec.a, spec.b, rng);
    case InitMethod::zeros:    return std::vector<float>(n, 0.0f);
    case InitMethod::ones:     return std::vector<float>(n, 1.0f);
    case InitMethod::constant: return std::vector<float>(n, spec.a);
    case InitMethod::sparse_random: {
      std::bernoulli_distribution keep(1.0 - static_cast<double>(spec.a));
      std::normal_distribution<float> value(0.0f, 0.01f);
      std::vector<float> out(n, 0.0f);
      for (auto& x : out) {
        if (keep(rng)) x = value(rng);
      }
      return out;
    }
  }
  return std::vector<float>(n, 0.0f);
}

// Gram-Schmidt over Gaussian rows; rows that collapse numerically are redrawn.
auto orthogonal_matrix(std::size_t rows, std::size_t cols, std::mt19937_64& rng)
    -> std::vector<float> {
  const bool transpose = rows > cols;
  const std::size_t r = transpose ? cols : rows;
  const std::size_t c = transpose ? rows : cols;
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> q(r * c);

  for (std::size_t i = 0; i < r; ++i) {
    std::span<float> row(q.data() + i * c, c);
    for (int attempt = 0; attempt < 8; ++attempt) {
      for (auto& x : row) x = dist(rng);
      for (std::size_t j = 0; j < i; ++j) {
        std::span<const float> prev(q.data() + j * c, c);
        const float proj = kernels::inner_product(row, prev);
        for (std::size_t d = 0; d < c; ++d) row[d] -= proj * prev[d];
      }
      const float norm = kernels::l2_norm(row);
      if (norm > 1e-6f) {
        for (auto& x : row) x /= norm;
        break;
      }
    }
  }

  if (!transpose) return q;
  std::vector<float> out(rows * cols);
  for (std::size_t i = 0; i < r; ++i) {
    for (std::size_t j = 0; j < c; ++j) out[j * cols + i] = q[i * c + j];
  }
  return out;
}

auto parse_init_method(std::string_view text) -> std::expected<InitMethod, core::error> {
  struct Entry { std::string_view name; InitMethod method; };
  static constexpr Entry kTable[] = {
      {"xavier_uniform", InitMethod::xavier_uniform}, {"xavier_normal", InitMethod::xavier_normal},
      {"he_uniform", InitMethod::he_uniform},         {"he_normal", InitMethod::he_normal},
      {"lecun_uniform", InitMethod::lecun_uniform},   {"lecun_normal", InitMethod::lecun_normal},
      {"uniform", InitMethod::uniform},               {"normal", InitMethod::normal},
      {"zeros", InitMethod::zeros},                   {"ones", InitMethod::ones},
      {"constant", InitMethod::constant},             {"sparse_random", InitMethod::sparse_random},
  };
  for (const auto& e : kTable) {
    if (e.name == text) return e.method;
  }
  return core::make_error(core::error_code::config_invalid,
                          "unknown init method: " + std::string(text), "train.initializer");
}

auto EmbeddingInitializer::generate(entity_id id) const -> std::vector<float> {
  std::mt19937_64 rng(mix_seed(id ^ base_seed_));
  return initialize_values(spec_, dim_, rng);
}

} // namespace kestrel::train
