#pragma once

/** \file collaborative_filtering.hpp
 *  \brief Bilinear collaborative filtering trained by online gradient steps.
 *
 * Score model: prediction(u, i) = <U[u], V[i]>. For one example with label y:
 *   e   = y - <u, v>
 *   g_u = e * v - lambda * u
 *   g_v = e * u - lambda * v
 * and both embeddings take a plain step u += eta * g_u, v += eta * g_v,
 * using pre-update values for both gradients. The step is fixed; the
 * train::Optimizer family is not consulted.
 *
 * Embeddings are created lazily on first training touch from the
 * deterministic per-id initializer. Thread-safety: none; RecommenderModel
 * serializes access.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "kestrel/error.hpp"
#include "kestrel/model/embedding_store.hpp"
#include "kestrel/train/initializer.hpp"
#include "kestrel/types.hpp"

namespace kestrel::model {

/** \brief Model hyper-parameters. */
struct CollaborativeFilteringConfig {
  std::size_t embedding_dim{128};
  float learning_rate{0.001f};
  float regularization{0.01f};
  train::InitSpec init{};
  std::uint64_t init_seed{0};
};

/** \brief Outcome of one train() call. */
struct TrainReport {
  std::size_t applied{0};       /**< examples that produced an update */
  std::size_t rejected{0};      /**< examples skipped by validation */
  double mean_squared_error{0}; /**< pre-update squared error over applied examples */
};

class CollaborativeFiltering {
public:
  static auto create(const CollaborativeFilteringConfig& cfg)
      -> std::expected<CollaborativeFiltering, core::error>;

  CollaborativeFiltering(CollaborativeFiltering&&) noexcept = default;
  CollaborativeFiltering& operator=(CollaborativeFiltering&&) noexcept = default;

  /** \brief Create the embedding of `id` if absent. */
  auto initialize_user_embedding(entity_id id) -> void;
  auto initialize_item_embedding(entity_id id) -> void;

  /** \brief One gradient step; returns the pre-update error y - <u, v>. */
  auto sgd_update(const TrainingExample& example) -> float;

  /** \brief Validate and apply every example in order; invalid ones are skipped. */
  auto train(std::span<const TrainingExample> examples) -> TrainReport;

  /** \brief Dot product of two caller-supplied vectors. */
  auto predict(std::span<const float> user, std::span<const float> item) const
      -> std::expected<float, core::error>;

  /** \brief Stored vector, or the deterministic initial vector (not inserted). */
  [[nodiscard]] auto get_user_embedding(entity_id id) const -> std::vector<float>;
  [[nodiscard]] auto get_item_embedding(entity_id id) const -> std::vector<float>;

  [[nodiscard]] auto has_user(entity_id id) const -> bool { return users_.contains(id); }
  [[nodiscard]] auto has_item(entity_id id) const -> bool { return items_.contains(id); }

  /** \brief Mean squared error over examples whose embeddings both exist; 0 if none. */
  [[nodiscard]] auto compute_loss(std::span<const TrainingExample> examples) const -> double;

  /** \brief Replace all embeddings with `params`. */
  auto update_parameters(const ModelParameters& params) -> std::expected<void, core::error>;

  /** \brief Export every embedding with version "v<unix-millis of now>". */
  [[nodiscard]] auto snapshot(time_point now) const -> ModelParameters;

  [[nodiscard]] auto user_count() const noexcept -> std::size_t { return users_.size(); }
  [[nodiscard]] auto item_count() const noexcept -> std::size_t { return items_.size(); }
  [[nodiscard]] auto dimension() const noexcept -> std::size_t { return cfg_.embedding_dim; }
  [[nodiscard]] auto config() const noexcept -> const CollaborativeFilteringConfig& { return cfg_; }
  [[nodiscard]] auto initializer() const noexcept -> const train::EmbeddingInitializer& { return init_; }
  [[nodiscard]] auto name() const noexcept -> const char* { return "collaborative_filtering"; }

private:
  explicit CollaborativeFiltering(CollaborativeFilteringConfig cfg);

  CollaborativeFilteringConfig cfg_;
  train::EmbeddingInitializer init_;
  EmbeddingStore users_;
  EmbeddingStore items_;
  std::vector<float> grad_u_;   // scratch
  std::vector<float> grad_v_;
};

/** \brief "v" followed by milliseconds since the Unix epoch. */
auto version_for(time_point t) -> std::string;

} // namespace kestrel::model
