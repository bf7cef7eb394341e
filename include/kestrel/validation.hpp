#pragma once

/** \file validation.hpp
 *  \brief Ingestion-boundary checks for examples, profiles, features and parameters.
 *
 * All checks return invalid_argument errors with component "validation".
 */

#include <cstddef>
#include <expected>
#include <span>

#include "kestrel/error.hpp"
#include "kestrel/types.hpp"

namespace kestrel::validation {

inline constexpr std::size_t kMaxFeatureLength = 2048;
inline constexpr std::size_t kMaxContextLength = 512;
inline constexpr std::size_t kMaxEmbeddingDimension = 2048;
inline constexpr std::size_t kMaxCategoryLength = 100;
inline constexpr std::size_t kMaxVersionLength = 100;
inline constexpr std::size_t kMaxBatchSize = 100000;

/** \brief Non-empty, finite, at most kMaxEmbeddingDimension values. */
auto validate_embedding(std::span<const float> values)
    -> std::expected<void, core::error>;

/** \brief Exact length check. */
auto validate_embedding_dimension(std::span<const float> values, std::size_t expected)
    -> std::expected<void, core::error>;

/** \brief Label in [0,1]; user/item features non-empty, finite, bounded; context bounded. */
auto validate_training_example(const TrainingExample& example)
    -> std::expected<void, core::error>;

auto validate_user_profile(const UserProfile& profile)
    -> std::expected<void, core::error>;

auto validate_item_feature(const ItemFeature& feature)
    -> std::expected<void, core::error>;

/** \brief Version 1..100 chars; every record has `dimension` finite values. */
auto validate_model_parameters(const ModelParameters& params)
    -> std::expected<void, core::error>;

auto validate_batch_size(std::size_t batch_size, std::size_t max_batch_size = kMaxBatchSize)
    -> std::expected<void, core::error>;

} // namespace kestrel::validation
