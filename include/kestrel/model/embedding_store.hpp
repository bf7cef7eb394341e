#pragma once

/** \file embedding_store.hpp
 *  \brief Dense id -> embedding table (row arena plus hash index).
 *
 * Rows are appended and never individually deleted; clear() drops all of
 * them. Spans returned by row() are invalidated by the next insertion, so
 * resolve every slot first and only then take spans.
 *
 * Thread-safety: none; the owning model serializes access.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "kestrel/types.hpp"

namespace kestrel::model {

class EmbeddingStore {
public:
  explicit EmbeddingStore(std::size_t dimension) : dim_(dimension) {}

  /** \brief Slot of `id`, if present. */
  [[nodiscard]] auto find(entity_id id) const -> std::optional<std::size_t> {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
  }

  [[nodiscard]] auto contains(entity_id id) const -> bool { return index_.contains(id); }

  /** \brief Slot of `id`, appending `init()` when absent. */
  template <typename Init>
  auto get_or_insert(entity_id id, Init&& init) -> std::size_t {
    if (auto it = index_.find(id); it != index_.end()) return it->second;
    const std::vector<float> values = init();
    return append(id, values);
  }

  /** \brief Overwrite (or append) the row of `id`. values.size() must equal dimension(). */
  auto assign(entity_id id, std::span<const float> values) -> std::size_t;

  [[nodiscard]] auto row(std::size_t slot) -> std::span<float> {
    return {data_.data() + slot * dim_, dim_};
  }
  [[nodiscard]] auto row(std::size_t slot) const -> std::span<const float> {
    return {data_.data() + slot * dim_, dim_};
  }

  [[nodiscard]] auto id_at(std::size_t slot) const -> entity_id { return ids_[slot]; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return ids_.size(); }
  [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }

  auto clear() -> void;
  auto reserve(std::size_t rows) -> void;

  /** \brief Copy every row out, in slot order. */
  [[nodiscard]] auto export_records() const -> std::vector<EmbeddingRecord>;

private:
  auto append(entity_id id, std::span<const float> values) -> std::size_t;

  std::size_t dim_;
  std::vector<float> data_;
  std::vector<entity_id> ids_;
  std::unordered_map<entity_id, std::size_t> index_;
};

} // namespace kestrel::model
