#include "kestrel/model/collaborative_filtering.hpp"

#include <cmath>

#include "kestrel/kernels/distance.hpp"
#include "kestrel/validation.hpp"

namespace kestrel::model {

using core::error_code;

auto version_for(time_point t) -> std::string {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  return "v" + std::to_string(ms);
}

CollaborativeFiltering::CollaborativeFiltering(CollaborativeFilteringConfig cfg)
    : cfg_(cfg),
      init_(cfg.init, cfg.embedding_dim, cfg.init_seed),
      users_(cfg.embedding_dim),
      items_(cfg.embedding_dim),
      grad_u_(cfg.embedding_dim),
      grad_v_(cfg.embedding_dim) {}

auto CollaborativeFiltering::create(const CollaborativeFilteringConfig& cfg)
    -> std::expected<CollaborativeFiltering, core::error> {
  if (cfg.embedding_dim == 0 || cfg.embedding_dim > validation::kMaxEmbeddingDimension) {
    return core::make_error(error_code::config_invalid, "embedding_dim out of range", "model.cf");
  }
  if (!std::isfinite(cfg.regularization) || cfg.regularization < 0.0f) {
    return core::make_error(error_code::config_invalid, "regularization must be >= 0", "model.cf");
  }
  if (!std::isfinite(cfg.learning_rate) || cfg.learning_rate <= 0.0f) {
    return core::make_error(error_code::config_invalid, "learning_rate must be > 0", "model.cf");
  }
  return CollaborativeFiltering(cfg);
}

auto CollaborativeFiltering::initialize_user_embedding(entity_id id) -> void {
  users_.get_or_insert(id, [&] { return init_.initialize_user_embedding(id); });
}

auto CollaborativeFiltering::initialize_item_embedding(entity_id id) -> void {
  items_.get_or_insert(id, [&] { return init_.initialize_item_embedding(id); });
}

auto CollaborativeFiltering::sgd_update(const TrainingExample& example) -> float {
  const std::size_t us = users_.get_or_insert(example.user_id, [&] {
    return init_.initialize_user_embedding(example.user_id);
  });
  const std::size_t is = items_.get_or_insert(example.item_id, [&] {
    return init_.initialize_item_embedding(example.item_id);
  });
  auto u = users_.row(us);
  auto v = items_.row(is);

  const float err = example.label - kernels::inner_product(u, v);
  const float lambda = cfg_.regularization;
  const float lr = cfg_.learning_rate;
  for (std::size_t d = 0; d < cfg_.embedding_dim; ++d) {
    grad_u_[d] = err * v[d] - lambda * u[d];
    grad_v_[d] = err * u[d] - lambda * v[d];
  }
  // Both gradients use pre-update values, so step only after computing them.
  for (std::size_t d = 0; d < cfg_.embedding_dim; ++d) {
    u[d] += lr * grad_u_[d];
    v[d] += lr * grad_v_[d];
  }
  return err;
}

auto CollaborativeFiltering::train(std::span<const TrainingExample> examples) -> TrainReport {
  TrainReport report;
  double sq = 0.0;
  for (const auto& ex : examples) {
    if (!validation::validate_training_example(ex)) {
      ++report.rejected;
      continue;
    }
    const float err = sgd_update(ex);
    sq += static_cast<double>(err) * err;
    ++report.applied;
  }
  if (report.applied > 0) report.mean_squared_error = sq / static_cast<double>(report.applied);
  return report;
}

auto CollaborativeFiltering::predict(std::span<const float> user, std::span<const float> item) const
    -> std::expected<float, core::error> {
  if (user.empty() || item.empty()) {
    return core::make_error(error_code::invalid_argument, "predict: empty vector", "model.cf");
  }
  if (user.size() != item.size()) {
    return core::make_error(error_code::invalid_argument,
                            "predict: length mismatch " + std::to_string(user.size()) + " vs " +
                                std::to_string(item.size()),
                            "model.cf");
  }
  return kernels::inner_product(user, item);
}

auto CollaborativeFiltering::get_user_embedding(entity_id id) const -> std::vector<float> {
  if (auto slot = users_.find(id)) {
    auto r = users_.row(*slot);
    return {r.begin(), r.end()};
  }
  return init_.initialize_user_embedding(id);
}

auto CollaborativeFiltering::get_item_embedding(entity_id id) const -> std::vector<float> {
  if (auto slot = items_.find(id)) {
    auto r = items_.row(*slot);
    return {r.begin(), r.end()};
  }
  return init_.initialize_item_embedding(id);
}

auto CollaborativeFiltering::compute_loss(std::span<const TrainingExample> examples) const -> double {
  double total = 0.0;
  std::size_t counted = 0;
  for (const auto& ex : examples) {
    auto us = users_.find(ex.user_id);
    auto is = items_.find(ex.item_id);
    if (!us || !is) continue;
    const double err = static_cast<double>(ex.label) -
                       static_cast<double>(kernels::inner_product(users_.row(*us), items_.row(*is)));
    total += err * err;
    ++counted;
  }
  return counted == 0 ? 0.0 : total / static_cast<double>(counted);
}

auto CollaborativeFiltering::update_parameters(const ModelParameters& params)
    -> std::expected<void, core::error> {
  if (auto ok = validation::validate_model_parameters(params); !ok) return ok;
  if (params.dimension != cfg_.embedding_dim) {
    return core::make_error(error_code::invalid_argument,
                            "parameter dimension " + std::to_string(params.dimension) +
                                " does not match model dimension " +
                                std::to_string(cfg_.embedding_dim),
                            "model.cf");
  }
  users_.clear();
  items_.clear();
  users_.reserve(params.users.size());
  items_.reserve(params.items.size());
  for (const auto& r : params.users) users_.assign(r.id, r.values);
  for (const auto& r : params.items) items_.assign(r.id, r.values);
  return {};
}

auto CollaborativeFiltering::snapshot(time_point now) const -> ModelParameters {
  ModelParameters p;
  p.version = version_for(now);
  p.dimension = cfg_.embedding_dim;
  p.users = users_.export_records();
  p.items = items_.export_records();
  p.bias_weights.assign(cfg_.embedding_dim, 0.0f);
  p.updated_at = now;
  return p;
}

} // namespace kestrel::model
