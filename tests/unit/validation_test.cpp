#include <catch2/catch_all.hpp>

#include <limits>
#include <string>
#include <vector>

#include "kestrel/validation.hpp"
#include "tests/support/example_factory.hpp"

using namespace kestrel;

namespace {

void require_invalid(const std::expected<void, core::error>& r) {
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::invalid_argument);
  REQUIRE(r.error().component == "validation");
}

} // namespace

TEST_CASE("embedding bounds", "[validation]") {
  std::vector<float> ok(8, 0.5f);
  REQUIRE(validation::validate_embedding(ok).has_value());

  require_invalid(validation::validate_embedding(std::vector<float>{}));

  std::vector<float> big(validation::kMaxEmbeddingDimension + 1, 0.0f);
  require_invalid(validation::validate_embedding(big));
  big.pop_back();
  REQUIRE(validation::validate_embedding(big).has_value());

  ok[3] = std::numeric_limits<float>::quiet_NaN();
  require_invalid(validation::validate_embedding(ok));
  ok[3] = std::numeric_limits<float>::infinity();
  require_invalid(validation::validate_embedding(ok));
}

TEST_CASE("embedding dimension must match exactly", "[validation]") {
  std::vector<float> v(4, 1.0f);
  REQUIRE(validation::validate_embedding_dimension(v, 4).has_value());
  require_invalid(validation::validate_embedding_dimension(v, 5));
  require_invalid(validation::validate_embedding_dimension(v, 3));
}

TEST_CASE("training example label range", "[validation]") {
  auto ex = example_factory::make_example(1, 2, 0.0f, 4);
  REQUIRE(validation::validate_training_example(ex).has_value());
  ex.label = 1.0f;
  REQUIRE(validation::validate_training_example(ex).has_value());

  ex.label = -0.01f;
  require_invalid(validation::validate_training_example(ex));
  ex.label = 1.01f;
  require_invalid(validation::validate_training_example(ex));
  ex.label = std::numeric_limits<float>::quiet_NaN();
  require_invalid(validation::validate_training_example(ex));
}

TEST_CASE("training example feature checks", "[validation]") {
  auto ex = example_factory::make_example(1, 2, 1.0f, 4);

  SECTION("empty user features") {
    ex.user_features.clear();
    require_invalid(validation::validate_training_example(ex));
  }
  SECTION("empty item features") {
    ex.item_features.clear();
    require_invalid(validation::validate_training_example(ex));
  }
  SECTION("non-finite item feature") {
    ex.item_features[0] = std::numeric_limits<float>::infinity();
    require_invalid(validation::validate_training_example(ex));
  }
  SECTION("oversized user features") {
    ex.user_features.assign(validation::kMaxFeatureLength + 1, 0.0f);
    require_invalid(validation::validate_training_example(ex));
  }
  SECTION("context may be empty but is bounded") {
    ex.context_features.clear();
    REQUIRE(validation::validate_training_example(ex).has_value());
    ex.context_features.assign(validation::kMaxContextLength, 0.1f);
    REQUIRE(validation::validate_training_example(ex).has_value());
    ex.context_features.push_back(0.1f);
    require_invalid(validation::validate_training_example(ex));
  }
  SECTION("non-finite context") {
    ex.context_features = {0.0f, std::numeric_limits<float>::quiet_NaN()};
    require_invalid(validation::validate_training_example(ex));
  }
}

TEST_CASE("user profile checks", "[validation]") {
  UserProfile p;
  p.user_id = 5;
  p.embedding = {0.1f, 0.2f};
  p.preferences = {{"sports", 0.7f}};
  REQUIRE(validation::validate_user_profile(p).has_value());

  p.preferences.push_back({"", 1.0f});
  require_invalid(validation::validate_user_profile(p));
  p.preferences.back() = {"music", std::numeric_limits<float>::infinity()};
  require_invalid(validation::validate_user_profile(p));
  p.preferences.pop_back();

  p.embedding.clear();
  require_invalid(validation::validate_user_profile(p));
}

TEST_CASE("item feature checks", "[validation]") {
  ItemFeature f;
  f.item_id = 9;
  f.embedding = {1.0f, 0.0f, 0.0f};
  f.category = "books";
  f.popularity_score = 0.5f;
  REQUIRE(validation::validate_item_feature(f).has_value());

  SECTION("category required and bounded") {
    f.category.clear();
    require_invalid(validation::validate_item_feature(f));
    f.category = std::string(validation::kMaxCategoryLength, 'c');
    REQUIRE(validation::validate_item_feature(f).has_value());
    f.category.push_back('c');
    require_invalid(validation::validate_item_feature(f));
  }
  SECTION("popularity in [0,1]") {
    f.popularity_score = 0.0f;
    REQUIRE(validation::validate_item_feature(f).has_value());
    f.popularity_score = 1.0f;
    REQUIRE(validation::validate_item_feature(f).has_value());
    f.popularity_score = 1.5f;
    require_invalid(validation::validate_item_feature(f));
    f.popularity_score = -0.1f;
    require_invalid(validation::validate_item_feature(f));
  }
  SECTION("embedding required") {
    f.embedding.clear();
    require_invalid(validation::validate_item_feature(f));
  }
}

TEST_CASE("model parameter checks", "[validation]") {
  ModelParameters params;
  params.version = "v1";
  params.dimension = 2;
  params.users = {{1, {0.1f, 0.2f}}};
  params.items = {{7, {0.3f, 0.4f}}};
  params.bias_weights = {0.0f, 0.0f};
  REQUIRE(validation::validate_model_parameters(params).has_value());

  SECTION("version length") {
    params.version.clear();
    require_invalid(validation::validate_model_parameters(params));
    params.version = std::string(validation::kMaxVersionLength, 'v');
    REQUIRE(validation::validate_model_parameters(params).has_value());
    params.version.push_back('v');
    require_invalid(validation::validate_model_parameters(params));
  }
  SECTION("row dimension") {
    params.items[0].values.push_back(0.5f);
    require_invalid(validation::validate_model_parameters(params));
  }
  SECTION("non-finite row") {
    params.users[0].values[1] = std::numeric_limits<float>::quiet_NaN();
    require_invalid(validation::validate_model_parameters(params));
  }
  SECTION("zero dimension") {
    params.dimension = 0;
    require_invalid(validation::validate_model_parameters(params));
  }
  SECTION("bias may be absent but not mis-sized") {
    params.bias_weights.clear();
    REQUIRE(validation::validate_model_parameters(params).has_value());
    params.bias_weights = {0.0f};
    require_invalid(validation::validate_model_parameters(params));
  }
}

TEST_CASE("batch size bounds", "[validation]") {
  REQUIRE(validation::validate_batch_size(1).has_value());
  REQUIRE(validation::validate_batch_size(validation::kMaxBatchSize).has_value());
  require_invalid(validation::validate_batch_size(0));
  require_invalid(validation::validate_batch_size(validation::kMaxBatchSize + 1));
  require_invalid(validation::validate_batch_size(11, 10));
}
