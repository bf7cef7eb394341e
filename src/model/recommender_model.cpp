#include "kestrel/model/recommender_model.hpp"

#include <mutex>

namespace kestrel::model {

auto RecommenderModel::create(const CollaborativeFilteringConfig& cfg)
    -> std::expected<std::unique_ptr<RecommenderModel>, core::error> {
  auto cf = CollaborativeFiltering::create(cfg);
  if (!cf) return std::unexpected(cf.error());
  return std::make_unique<RecommenderModel>(Algorithm{std::move(*cf)});
}

auto RecommenderModel::train(std::span<const TrainingExample> examples) -> TrainReport {
  std::unique_lock lock(mutex_);
  return std::visit([&](auto& algo) { return algo.train(examples); }, algorithm_);
}

auto RecommenderModel::predict(std::span<const float> user, std::span<const float> item) const
    -> std::expected<float, core::error> {
  std::shared_lock lock(mutex_);
  return std::visit([&](const auto& algo) { return algo.predict(user, item); }, algorithm_);
}

auto RecommenderModel::get_user_embedding(entity_id id) const -> std::vector<float> {
  std::shared_lock lock(mutex_);
  return std::visit([&](const auto& algo) { return algo.get_user_embedding(id); }, algorithm_);
}

auto RecommenderModel::get_item_embedding(entity_id id) const -> std::vector<float> {
  std::shared_lock lock(mutex_);
  return std::visit([&](const auto& algo) { return algo.get_item_embedding(id); }, algorithm_);
}

auto RecommenderModel::compute_loss(std::span<const TrainingExample> examples) const -> double {
  std::shared_lock lock(mutex_);
  return std::visit([&](const auto& algo) { return algo.compute_loss(examples); }, algorithm_);
}

auto RecommenderModel::update_parameters(const ModelParameters& params)
    -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  return std::visit([&](auto& algo) { return algo.update_parameters(params); }, algorithm_);
}

auto RecommenderModel::snapshot(time_point now) const -> ModelParameters {
  std::shared_lock lock(mutex_);
  return std::visit([&](const auto& algo) { return algo.snapshot(now); }, algorithm_);
}

auto RecommenderModel::dimension() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return std::visit([](const auto& algo) { return algo.dimension(); }, algorithm_);
}

auto RecommenderModel::user_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return std::visit([](const auto& algo) { return algo.user_count(); }, algorithm_);
}

auto RecommenderModel::item_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return std::visit([](const auto& algo) { return algo.item_count(); }, algorithm_);
}

auto RecommenderModel::algorithm_name() const -> const char* {
  return std::visit([](const auto& algo) { return algo.name(); }, algorithm_);
}

} // namespace kestrel::model
