#pragma once

/** \file recommender_model.hpp
 *  \brief Thread-safe owner of the active recommendation algorithm.
 *
 * One reader/writer lock guards both embedding stores. train() and
 * update_parameters() hold it exclusively for their whole duration, so
 * readers never observe a half-applied batch. Callers that also touch a
 * VectorIndex must release this lock before taking the index lock.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <variant>
#include <vector>

#include "kestrel/error.hpp"
#include "kestrel/model/collaborative_filtering.hpp"
#include "kestrel/types.hpp"

namespace kestrel::model {

/** \brief Closed set of pluggable algorithms. */
using Algorithm = std::variant<CollaborativeFiltering>;

class RecommenderModel {
public:
  explicit RecommenderModel(Algorithm algorithm) : algorithm_(std::move(algorithm)) {}

  /** \brief Build a model running collaborative filtering. */
  static auto create(const CollaborativeFilteringConfig& cfg)
      -> std::expected<std::unique_ptr<RecommenderModel>, core::error>;

  RecommenderModel(const RecommenderModel&) = delete;
  RecommenderModel& operator=(const RecommenderModel&) = delete;

  auto train(std::span<const TrainingExample> examples) -> TrainReport;

  auto predict(std::span<const float> user, std::span<const float> item) const
      -> std::expected<float, core::error>;

  [[nodiscard]] auto get_user_embedding(entity_id id) const -> std::vector<float>;
  [[nodiscard]] auto get_item_embedding(entity_id id) const -> std::vector<float>;

  [[nodiscard]] auto compute_loss(std::span<const TrainingExample> examples) const -> double;

  auto update_parameters(const ModelParameters& params) -> std::expected<void, core::error>;

  [[nodiscard]] auto snapshot(time_point now = std::chrono::system_clock::now()) const
      -> ModelParameters;

  [[nodiscard]] auto dimension() const -> std::size_t;
  [[nodiscard]] auto user_count() const -> std::size_t;
  [[nodiscard]] auto item_count() const -> std::size_t;
  [[nodiscard]] auto algorithm_name() const -> const char*;

private:
  mutable std::shared_mutex mutex_;
  Algorithm algorithm_;
};

} // namespace kestrel::model
