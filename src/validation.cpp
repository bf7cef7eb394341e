#include "kestrel/validation.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace kestrel::validation {

namespace {

using core::error_code;

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::make_error(error_code::invalid_argument, std::move(message), "validation");
}

auto all_finite(std::span<const float> values) -> bool {
  return std::all_of(values.begin(), values.end(), [](float x) { return std::isfinite(x); });
}

auto check_features(std::span<const float> values, const char* what, std::size_t max_len,
                    bool allow_empty) -> std::expected<void, core::error> {
  if (!allow_empty && values.empty()) {
    return invalid(std::string(what) + " cannot be empty");
  }
  if (values.size() > max_len) {
    return invalid(std::string(what) + " too long: " + std::to_string(values.size()) +
                   " > " + std::to_string(max_len));
  }
  if (!all_finite(values)) {
    return invalid(std::string(what) + " contain non-finite values");
  }
  return {};
}

} // namespace

auto validate_embedding(std::span<const float> values)
    -> std::expected<void, core::error> {
  if (values.empty()) return invalid("embedding cannot be empty");
  if (values.size() > kMaxEmbeddingDimension) {
    return invalid("embedding dimension too large: " + std::to_string(values.size()));
  }
  if (!all_finite(values)) return invalid("embedding contains non-finite values");
  return {};
}

auto validate_embedding_dimension(std::span<const float> values, std::size_t expected)
    -> std::expected<void, core::error> {
  if (values.size() != expected) {
    return invalid("embedding dimension mismatch: expected " + std::to_string(expected) +
                   ", got " + std::to_string(values.size()));
  }
  return {};
}

auto validate_training_example(const TrainingExample& example)
    -> std::expected<void, core::error> {
  if (!std::isfinite(example.label) || example.label < 0.0f || example.label > 1.0f) {
    return invalid("label must be finite and within [0,1]");
  }
  if (auto r = check_features(example.user_features, "user features", kMaxFeatureLength, false); !r) {
    return r;
  }
  if (auto r = check_features(example.item_features, "item features", kMaxFeatureLength, false); !r) {
    return r;
  }
  return check_features(example.context_features, "context features", kMaxContextLength, true);
}

auto validate_user_profile(const UserProfile& profile)
    -> std::expected<void, core::error> {
  if (auto r = validate_embedding(profile.embedding); !r) return r;
  for (const auto& [key, weight] : profile.preferences) {
    if (key.empty()) return invalid("preference key cannot be empty");
    if (!std::isfinite(weight)) return invalid("preference weight must be finite");
  }
  return {};
}

auto validate_item_feature(const ItemFeature& feature)
    -> std::expected<void, core::error> {
  if (auto r = validate_embedding(feature.embedding); !r) return r;
  if (feature.category.empty()) return invalid("category cannot be empty");
  if (feature.category.size() > kMaxCategoryLength) return invalid("category too long");
  if (!std::isfinite(feature.popularity_score) || feature.popularity_score < 0.0f ||
      feature.popularity_score > 1.0f) {
    return invalid("popularity score must be within [0,1]");
  }
  return {};
}

auto validate_model_parameters(const ModelParameters& params)
    -> std::expected<void, core::error> {
  if (params.version.empty()) return invalid("model version cannot be empty");
  if (params.version.size() > kMaxVersionLength) return invalid("model version too long");
  if (params.dimension == 0) return invalid("model dimension must be positive");
  const auto check_rows = [&](const std::vector<EmbeddingRecord>& rows, const char* what)
      -> std::expected<void, core::error> {
    for (const auto& row : rows) {
      if (row.values.size() != params.dimension) {
        return invalid(std::string(what) + " embedding " + std::to_string(row.id) +
                       " has wrong dimension");
      }
      if (!all_finite(row.values)) {
        return invalid(std::string(what) + " embedding " + std::to_string(row.id) +
                       " contains non-finite values");
      }
    }
    return {};
  };
  if (auto r = check_rows(params.users, "user"); !r) return r;
  if (auto r = check_rows(params.items, "item"); !r) return r;
  if (!params.bias_weights.empty() && params.bias_weights.size() != params.dimension) {
    return invalid("bias weights have wrong dimension");
  }
  return {};
}

auto validate_batch_size(std::size_t batch_size, std::size_t max_batch_size)
    -> std::expected<void, core::error> {
  if (batch_size == 0) return invalid("batch size must be positive");
  if (batch_size > max_batch_size) {
    return invalid("batch size too large: " + std::to_string(batch_size) + " > " +
                   std::to_string(max_batch_size));
  }
  return {};
}

} // namespace kestrel::validation
