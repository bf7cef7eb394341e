#include "kestrel/model/embedding_store.hpp"

#include <algorithm>

namespace kestrel::model {

auto EmbeddingStore::append(entity_id id, std::span<const float> values) -> std::size_t {
  const std::size_t slot = ids_.size();
  data_.insert(data_.end(), values.begin(), values.end());
  ids_.push_back(id);
  index_.emplace(id, slot);
  return slot;
}

auto EmbeddingStore::assign(entity_id id, std::span<const float> values) -> std::size_t {
  if (auto it = index_.find(id); it != index_.end()) {
    std::copy(values.begin(), values.end(), data_.begin() + static_cast<std::ptrdiff_t>(it->second * dim_));
    return it->second;
  }
  return append(id, values);
}

auto EmbeddingStore::clear() -> void {
  data_.clear();
  ids_.clear();
  index_.clear();
}

auto EmbeddingStore::reserve(std::size_t rows) -> void {
  data_.reserve(rows * dim_);
  ids_.reserve(rows);
  index_.reserve(rows);
}

auto EmbeddingStore::export_records() const -> std::vector<EmbeddingRecord> {
  std::vector<EmbeddingRecord> out;
  out.reserve(ids_.size());
  for (std::size_t slot = 0; slot < ids_.size(); ++slot) {
    auto r = row(slot);
    out.push_back({ids_[slot], std::vector<float>(r.begin(), r.end())});
  }
  return out;
}

} // namespace kestrel::model
