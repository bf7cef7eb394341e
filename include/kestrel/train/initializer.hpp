#pragma once

/** \file initializer.hpp
 *  \brief Embedding initialization methods and the deterministic per-id initializer.
 *
 * Scaled methods use the vector length n as the fan:
 *   xavier_uniform, he_uniform  U(-sqrt(6/n), +sqrt(6/n))
 *   xavier_normal, he_normal    N(0, sqrt(2/n))
 *   lecun_uniform               U(-sqrt(3/n), +sqrt(3/n))
 *   lecun_normal                N(0, sqrt(1/n))
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <random>
#include <string_view>
#include <vector>

#include "kestrel/error.hpp"
#include "kestrel/types.hpp"

namespace kestrel::train {

enum class InitMethod : std::uint8_t {
  xavier_uniform,
  xavier_normal,
  he_uniform,
  he_normal,
  lecun_uniform,
  lecun_normal,
  uniform,        /**< U(a, b) */
  normal,         /**< N(a, b) with b = stddev */
  zeros,
  ones,
  constant,       /**< a */
  sparse_random,  /**< N(0, 0.01) kept with probability 1 - a */
};

/** \brief Method plus its two optional parameters (meaning depends on method). */
struct InitSpec {
  InitMethod method{InitMethod::xavier_uniform};
  float a{0.0f};
  float b{1.0f};
};

/** \brief Fill `n` values using `spec`, drawing from `rng`. */
auto initialize_values(const InitSpec& spec, std::size_t n, std::mt19937_64& rng)
    -> std::vector<float>;

/** \brief Row-major rows x cols matrix with orthonormal rows (or columns when rows > cols). */
auto orthogonal_matrix(std::size_t rows, std::size_t cols, std::mt19937_64& rng)
    -> std::vector<float>;

auto parse_init_method(std::string_view text) -> std::expected<InitMethod, core::error>;

/** \brief SplitMix64 finalizer; used to derive per-id seeds. */
constexpr auto mix_seed(std::uint64_t x) noexcept -> std::uint64_t {
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

/**
 * \brief Produces the same initial vector for the same id every time.
 *
 * The per-id generator is seeded from mix_seed(id ^ base_seed) for every
 * method, so restarts and lookups of never-trained ids agree.
 */
class EmbeddingInitializer {
public:
  EmbeddingInitializer(InitSpec spec, std::size_t dimension, std::uint64_t base_seed = 0)
      : spec_(spec), dim_(dimension), base_seed_(base_seed) {}

  [[nodiscard]] auto initialize_user_embedding(entity_id id) const -> std::vector<float> {
    return generate(id);
  }
  [[nodiscard]] auto initialize_item_embedding(entity_id id) const -> std::vector<float> {
    return generate(id);
  }

  [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
  [[nodiscard]] auto spec() const noexcept -> const InitSpec& { return spec_; }

private:
  [[nodiscard]] auto generate(entity_id id) const -> std::vector<float>;

  InitSpec spec_;
  std::size_t dim_;
  std::uint64_t base_seed_;
};

} // namespace kestrel::train
