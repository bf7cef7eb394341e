#pragma once

/** \file config.hpp
 *  \brief Engine configuration and its KESTREL_* environment overlay.
 *
 * Recognised variables (all optional; unset or empty leaves the field alone):
 *   KESTREL_EMBEDDING_DIM, KESTREL_LEARNING_RATE, KESTREL_REGULARIZATION,
 *   KESTREL_INIT_METHOD, KESTREL_INIT_SEED,
 *   KESTREL_BATCH_SIZE, KESTREL_BATCH_TIMEOUT_MS, KESTREL_MODEL_SAVE_INTERVAL_S,
 *   KESTREL_NEGATIVE_SAMPLING_RATIO, KESTREL_CHANNEL_CAPACITY, KESTREL_PROPAGATION,
 *   KESTREL_INDEX_KIND, KESTREL_GRAPH_M, KESTREL_GRAPH_EF_CONSTRUCTION,
 *   KESTREL_GRAPH_EF_SEARCH, KESTREL_GRAPH_LINK, KESTREL_CHECKPOINT_DIR,
 *   KESTREL_CHECKPOINT_KEEP, KESTREL_SCHEDULER_THREADS, KESTREL_TRAINER_DEBUG
 */

#include <cstddef>
#include <expected>
#include <filesystem>

#include "kestrel/error.hpp"
#include "kestrel/index/index_factory.hpp"
#include "kestrel/model/collaborative_filtering.hpp"
#include "kestrel/service/training_orchestrator.hpp"

namespace kestrel {

/** \brief Everything needed to open an engine. */
struct EngineConfig {
  model::CollaborativeFilteringConfig model;
  service::TrainingConfig training;
  index::IndexConfig user_index;
  index::IndexConfig item_index;
  std::filesystem::path checkpoint_dir;   /**< empty: snapshots stay in memory */
  std::size_t checkpoint_keep{5};
  std::size_t scheduler_threads{2};       /**< at least 2: intake and snapshot loops */
};

/** \brief Range checks; failures are config_invalid. */
auto validate_config(const EngineConfig& cfg) -> std::expected<void, core::error>;

/** \brief `base` with KESTREL_* environment variables applied, then validated. */
auto load_config_from_env(EngineConfig base = {}) -> std::expected<EngineConfig, core::error>;

} // namespace kestrel
