#pragma once

/**
 * \file engine.hpp
 * \brief Public C++ API: the recommender engine facade.
 *
 * An engine owns the model, one user index and one item index, the intake
 * transport, the persistent store, the checkpoint sink and the worker pool
 * that runs the training loops.
 *
 * Thread-safety: every member function may be called concurrently. Reads
 * (predict, search_similar, recommend_for_user) never wait for the intake
 * channel; they only contend with a running flush for the model or index lock.
 *
 * Lifecycle: start() launches streaming training over publish(); stop()
 * drains and flushes what was published and is final for the transport.
 * train() runs the same flush pipeline synchronously and works with or
 * without start().
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "kestrel/config.hpp"
#include "kestrel/error.hpp"
#include "kestrel/filter/id_filter.hpp"
#include "kestrel/index/vector_index.hpp"
#include "kestrel/model/recommender_model.hpp"
#include "kestrel/service/collaborators.hpp"
#include "kestrel/service/training_orchestrator.hpp"
#include "kestrel/types.hpp"

namespace kestrel {

/** \brief Optional replacements for the in-process collaborators. */
struct EngineCollaborators {
  std::unique_ptr<service::PersistentStore> store;   /**< default: InMemoryPersistentStore */
  std::unique_ptr<service::CheckpointSink> sink;     /**< default: file sink when checkpoint_dir is set */
};

/** \brief Counters gathered across the engine. */
struct EngineStats {
  service::OrchestratorStats trainer;
  std::size_t user_index_size{0};
  std::size_t item_index_size{0};
  std::size_t pending_examples{0};
  bool running{false};
};

class engine {
public:
  /**
   * \brief Validate `cfg` and build every component.
   * \return engine on success; config_invalid or an index/model error otherwise
   */
  static auto open(EngineConfig cfg, EngineCollaborators collaborators = {})
      -> std::expected<engine, core::error>;

  engine(engine&&) noexcept;
  engine& operator=(engine&&) noexcept;
  ~engine();

  /** \brief Start the intake and snapshot loops. */
  auto start() -> std::expected<void, core::error>;
  /** \brief Flush what is queued and join the loops. */
  auto stop() -> void;
  [[nodiscard]] auto running() const -> bool;

  /** \brief Queue one example for streaming training; blocks while the channel is full. */
  auto publish(TrainingExample example) -> std::expected<void, core::error>;

  /** \brief Augment, train and propagate `examples` now. */
  auto train(std::span<const TrainingExample> examples)
      -> std::expected<service::FlushReport, core::error>;

  /** \brief Score two caller-supplied vectors. */
  auto predict(std::span<const float> user, std::span<const float> item) const
      -> std::expected<float, core::error>;

  /** \brief Nearest neighbours of `query` in the user or item index. */
  auto search_similar(std::span<const float> query, std::size_t k,
                      EmbeddingKind target = EmbeddingKind::item,
                      const filter::IdFilter* exclude = nullptr) const
      -> std::expected<std::vector<index::SearchHit>, core::error>;

  auto add_vector(entity_id id, std::span<const float> vec,
                  EmbeddingKind target = EmbeddingKind::item)
      -> std::expected<void, core::error>;
  auto update_vector(entity_id id, std::span<const float> vec,
                     EmbeddingKind target = EmbeddingKind::item)
      -> std::expected<void, core::error>;
  auto remove_vector(entity_id id, EmbeddingKind target = EmbeddingKind::item)
      -> std::expected<void, core::error>;

  /**
   * \brief Top-k items for `user`, searching the item index with the user's
   *        current model embedding.
   * \param exclude ids never returned (e.g. items already seen)
   */
  auto recommend_for_user(entity_id user, std::size_t k,
                          const filter::IdFilter* exclude = nullptr) const
      -> std::expected<std::vector<index::SearchHit>, core::error>;

  /** \brief Validate, write to the store, then to the user index. */
  auto upsert_user_profile(const UserProfile& profile) -> std::expected<void, core::error>;
  /** \brief Validate, write to the store, then to the item index. */
  auto upsert_item_feature(const ItemFeature& feature) -> std::expected<void, core::error>;

  /** \brief Snapshot the model into the checkpoint sink now. */
  auto snapshot_now() -> std::expected<void, core::error>;

  /**
   * \brief Load the newest checkpoint into the model.
   * \return version of the restored checkpoint; not_found when none exists
   */
  auto restore_latest_checkpoint() -> std::expected<std::string, core::error>;

  [[nodiscard]] auto stats() const -> EngineStats;
  [[nodiscard]] auto config() const -> const EngineConfig&;
  [[nodiscard]] auto model() const -> const model::RecommenderModel&;
  [[nodiscard]] auto user_index() const -> const index::VectorIndex&;
  [[nodiscard]] auto item_index() const -> const index::VectorIndex&;
  [[nodiscard]] auto store() -> service::PersistentStore&;
  [[nodiscard]] auto trainer() -> service::TrainingOrchestrator&;

private:
  struct Impl;
  explicit engine(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> impl_;
};

} // namespace kestrel
