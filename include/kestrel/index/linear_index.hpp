#pragma once

/** \file linear_index.hpp
 *  \brief Exact cosine-similarity index using a full scan.
 *
 * Storage is a dense row arena plus an id -> row map; removal moves the last
 * row into the freed slot. Norms are cached per row. Ties in the ranking are
 * broken by row order, which depends on insertion and removal history.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "kestrel/index/vector_index.hpp"

namespace kestrel::index {

class LinearIndex final : public VectorIndex {
public:
  /** \brief Build an empty index; dimension must be > 0. */
  static auto create(std::size_t dimension)
      -> std::expected<std::unique_ptr<LinearIndex>, core::error>;

  auto add(entity_id id, std::span<const float> vec)
      -> std::expected<void, core::error> override;
  auto update(entity_id id, std::span<const float> vec)
      -> std::expected<void, core::error> override;
  auto remove(entity_id id) -> std::expected<void, core::error> override;
  auto search_similar(std::span<const float> query, std::size_t k,
                      const filter::IdFilter* filter = nullptr) const
      -> std::expected<std::vector<SearchHit>, core::error> override;

  [[nodiscard]] auto contains(entity_id id) const -> bool override;
  [[nodiscard]] auto dimension() const noexcept -> std::size_t override { return dim_; }
  [[nodiscard]] auto size() const -> std::size_t override;
  [[nodiscard]] auto metric() const noexcept -> Metric override { return Metric::cosine_similarity; }
  [[nodiscard]] auto kind() const noexcept -> IndexKind override { return IndexKind::linear; }

  /** \brief Copy of the stored vector, or not_found. */
  auto get(entity_id id) const -> std::expected<std::vector<float>, core::error>;

private:
  explicit LinearIndex(std::size_t dimension) : dim_(dimension) {}

  auto check_dimension(std::span<const float> vec, const char* op) const
      -> std::expected<void, core::error>;

  std::size_t dim_;
  mutable std::shared_mutex mutex_;
  std::vector<float> rows_;                         // row-major, size() * dim_
  std::vector<float> norms_;
  std::vector<entity_id> row_ids_;
  std::unordered_map<entity_id, std::size_t> id_to_row_;
};

} // namespace kestrel::index
