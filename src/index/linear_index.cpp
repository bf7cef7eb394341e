#include "kestrel/index/linear_index.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <string>

#include "kestrel/kernels/distance.hpp"

namespace kestrel::index {

using core::error_code;

auto LinearIndex::create(std::size_t dimension)
    -> std::expected<std::unique_ptr<LinearIndex>, core::error> {
  if (dimension == 0) {
    return core::make_error(error_code::invalid_argument, "dimension must be > 0", "index.linear");
  }
  return std::unique_ptr<LinearIndex>(new LinearIndex(dimension));
}

auto LinearIndex::check_dimension(std::span<const float> vec, const char* op) const
    -> std::expected<void, core::error> {
  if (vec.size() != dim_) {
    return core::make_error(error_code::invalid_argument,
                            std::string(op) + ": dimension mismatch, expected " +
                                std::to_string(dim_) + " got " + std::to_string(vec.size()),
                            "index.linear");
  }
  return {};
}

auto LinearIndex::add(entity_id id, std::span<const float> vec)
    -> std::expected<void, core::error> {
  if (auto ok = check_dimension(vec, "add"); !ok) return ok;
  const float norm = kernels::l2_norm(vec);

  std::unique_lock lock(mutex_);
  if (auto it = id_to_row_.find(id); it != id_to_row_.end()) {
    std::memcpy(rows_.data() + it->second * dim_, vec.data(), dim_ * sizeof(float));
    norms_[it->second] = norm;
    return {};
  }
  const std::size_t row = row_ids_.size();
  rows_.insert(rows_.end(), vec.begin(), vec.end());
  norms_.push_back(norm);
  row_ids_.push_back(id);
  id_to_row_.emplace(id, row);
  return {};
}

auto LinearIndex::update(entity_id id, std::span<const float> vec)
    -> std::expected<void, core::error> {
  return add(id, vec);
}

auto LinearIndex::remove(entity_id id) -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  auto it = id_to_row_.find(id);
  if (it == id_to_row_.end()) return {};

  const std::size_t row = it->second;
  const std::size_t last = row_ids_.size() - 1;
  if (row != last) {
    std::memcpy(rows_.data() + row * dim_, rows_.data() + last * dim_, dim_ * sizeof(float));
    norms_[row] = norms_[last];
    row_ids_[row] = row_ids_[last];
    id_to_row_[row_ids_[row]] = row;
  }
  rows_.resize(last * dim_);
  norms_.pop_back();
  row_ids_.pop_back();
  id_to_row_.erase(id);
  return {};
}

auto LinearIndex::search_similar(std::span<const float> query, std::size_t k,
                                 const filter::IdFilter* filter) const
    -> std::expected<std::vector<SearchHit>, core::error> {
  if (auto ok = check_dimension(query, "search"); !ok) return std::unexpected(ok.error());
  if (k == 0) return std::vector<SearchHit>{};
  const float qnorm = kernels::l2_norm(query);

  std::shared_lock lock(mutex_);
  std::vector<SearchHit> hits;
  hits.reserve(row_ids_.size());
  for (std::size_t row = 0; row < row_ids_.size(); ++row) {
    const entity_id id = row_ids_[row];
    if (filter != nullptr && !filter->allows(id)) continue;
    std::span<const float> v(rows_.data() + row * dim_, dim_);
    const float dot = kernels::inner_product(query, v);
    hits.push_back({id, kernels::cosine_from_parts(dot, qnorm, norms_[row])});
  }
  lock.unlock();

  const std::size_t take = std::min(k, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(take), hits.end(),
                    [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
  hits.resize(take);
  return hits;
}

auto LinearIndex::contains(entity_id id) const -> bool {
  std::shared_lock lock(mutex_);
  return id_to_row_.contains(id);
}

auto LinearIndex::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return row_ids_.size();
}

auto LinearIndex::get(entity_id id) const -> std::expected<std::vector<float>, core::error> {
  std::shared_lock lock(mutex_);
  auto it = id_to_row_.find(id);
  if (it == id_to_row_.end()) {
    return core::make_error(error_code::not_found, "id not present", "index.linear");
  }
  const float* p = rows_.data() + it->second * dim_;
  return std::vector<float>(p, p + dim_);
}

} // namespace kestrel::index
