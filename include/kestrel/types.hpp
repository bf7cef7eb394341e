#pragma once

/** \file types.hpp
 *  \brief Value types shared by the model, the indexes and the trainer.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kestrel {

/** \brief Identifier of a user or an item. */
using entity_id = std::uint64_t;

using time_point = std::chrono::system_clock::time_point;

/** \brief Which embedding population a vector belongs to. */
enum class EmbeddingKind : std::uint8_t { user, item };

constexpr auto to_string(EmbeddingKind kind) noexcept -> const char* {
  return kind == EmbeddingKind::user ? "user" : "item";
}

/** \brief One observed (or synthesized) interaction. */
struct TrainingExample {
  entity_id user_id{0};
  entity_id item_id{0};
  float label{0.0f};                      /**< in [0,1]; > 0.5 counts as positive */
  std::vector<float> user_features;
  std::vector<float> item_features;
  std::vector<float> context_features;
  time_point timestamp{};
};

/** \brief Ingestion record for a user vector. */
struct UserProfile {
  entity_id user_id{0};
  std::vector<float> embedding;
  std::vector<std::pair<std::string, float>> preferences;
  time_point last_updated{};
  std::uint64_t interaction_count{0};
};

/** \brief Ingestion record for an item vector. */
struct ItemFeature {
  entity_id item_id{0};
  std::vector<float> embedding;
  std::string category;
  std::vector<std::string> tags;
  float popularity_score{0.0f};           /**< in [0,1] */
  time_point created_at{};
};

/** \brief One row of an exported embedding table. */
struct EmbeddingRecord {
  entity_id id{0};
  std::vector<float> values;
};

/** \brief Exported model state handed to checkpoint sinks. */
struct ModelParameters {
  std::string version;                    /**< "v<unix-millis>" for snapshots */
  std::size_t dimension{0};
  std::vector<EmbeddingRecord> users;
  std::vector<EmbeddingRecord> items;
  std::vector<float> bias_weights;        /**< dimension zeros */
  time_point updated_at{};
};

} // namespace kestrel
