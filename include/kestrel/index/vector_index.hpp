#pragma once

/** \file vector_index.hpp
 *  \brief Abstract nearest-neighbour index over fixed-dimension vectors.
 *
 * Contract shared by every implementation:
 * - Vectors whose length differs from dimension() are rejected with
 *   invalid_argument; nothing is modified.
 * - search_similar(query, 0) and searches over an empty index return an
 *   empty result, not an error.
 * - Results are ordered best-first in the index's own metric: descending
 *   for similarity metrics, ascending for distance metrics.
 * - Every operation takes the index's own reader/writer lock, independent
 *   of any lock held by the model.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "kestrel/error.hpp"
#include "kestrel/filter/id_filter.hpp"
#include "kestrel/types.hpp"

namespace kestrel::index {

enum class Metric : std::uint8_t {
  cosine_similarity,  /**< higher is better */
  l2_squared,         /**< lower is better */
};

enum class IndexKind : std::uint8_t { linear, graph };

/** \brief One search result. */
struct SearchHit {
  entity_id id{0};
  float score{0.0f};
};

/** \brief True when `a` ranks ahead of `b` under `metric`. */
constexpr auto better(Metric metric, float a, float b) noexcept -> bool {
  return metric == Metric::cosine_similarity ? a > b : a < b;
}

class VectorIndex {
public:
  virtual ~VectorIndex() = default;

  /** \brief Insert; an existing id is overwritten. */
  virtual auto add(entity_id id, std::span<const float> vec)
      -> std::expected<void, core::error> = 0;

  /** \brief Replace the vector of `id` (inserting when absent). */
  virtual auto update(entity_id id, std::span<const float> vec)
      -> std::expected<void, core::error> = 0;

  /** \brief Remove `id`; removing an absent id succeeds. */
  virtual auto remove(entity_id id) -> std::expected<void, core::error> = 0;

  /** \brief Up to k best matches, skipping ids rejected by `filter`. */
  virtual auto search_similar(std::span<const float> query, std::size_t k,
                              const filter::IdFilter* filter = nullptr) const
      -> std::expected<std::vector<SearchHit>, core::error> = 0;

  [[nodiscard]] virtual auto contains(entity_id id) const -> bool = 0;
  [[nodiscard]] virtual auto dimension() const noexcept -> std::size_t = 0;
  [[nodiscard]] virtual auto size() const -> std::size_t = 0;
  [[nodiscard]] virtual auto metric() const noexcept -> Metric = 0;
  [[nodiscard]] virtual auto kind() const noexcept -> IndexKind = 0;
};

auto parse_index_kind(std::string_view text) -> std::expected<IndexKind, core::error>;

constexpr auto to_string(IndexKind kind) noexcept -> const char* {
  return kind == IndexKind::linear ? "linear" : "graph";
}

} // namespace kestrel::index
