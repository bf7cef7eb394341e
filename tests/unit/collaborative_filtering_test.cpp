/** \file collaborative_filtering_test.cpp
 *  \brief Bilinear model: update rule, lazy initialization, loss and restore.
 */

#include <catch2/catch_all.hpp>

#include <chrono>
#include <vector>

#include "kestrel/kernels/distance.hpp"
#include "kestrel/model/collaborative_filtering.hpp"
#include "tests/support/example_factory.hpp"

using namespace kestrel;
using model::CollaborativeFiltering;
using model::CollaborativeFilteringConfig;
using Catch::Approx;

namespace {

auto make_model(std::size_t dim, float lr = 0.1f, float reg = 0.01f) -> CollaborativeFiltering {
  CollaborativeFilteringConfig cfg;
  cfg.embedding_dim = dim;
  cfg.learning_rate = lr;
  cfg.regularization = reg;
  auto m = CollaborativeFiltering::create(cfg);
  REQUIRE(m.has_value());
  return std::move(*m);
}

} // namespace

TEST_CASE("predict is the dot product of the supplied vectors", "[model][cf]") {
  auto m = make_model(2);
  REQUIRE(m.predict(std::vector<float>{1, 0}, std::vector<float>{0, 1}).value() == 0.0f);
  REQUIRE(m.predict(std::vector<float>{1, 1}, std::vector<float>{1, 1}).value() == 2.0f);

  auto empty = m.predict(std::vector<float>{}, std::vector<float>{1});
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.error().code == core::error_code::invalid_argument);
  REQUIRE_FALSE(m.predict(std::vector<float>{1, 2}, std::vector<float>{1}).has_value());
}

TEST_CASE("sgd_update applies the simultaneous gradient step", "[model][cf]") {
  const std::size_t dim = 8;
  const float lr = 0.1f, reg = 0.01f;
  auto m = make_model(dim, lr, reg);

  const auto u0 = m.get_user_embedding(1);
  const auto v0 = m.get_item_embedding(2);
  REQUIRE_FALSE(m.has_user(1));

  auto ex = example_factory::make_example(1, 2, 1.0f, dim);
  const float err = m.sgd_update(ex);
  const float expected_err = 1.0f - kernels::inner_product(u0, v0);
  REQUIRE(err == Approx(expected_err));

  const auto u1 = m.get_user_embedding(1);
  const auto v1 = m.get_item_embedding(2);
  for (std::size_t d = 0; d < dim; ++d) {
    REQUIRE(u1[d] == Approx(u0[d] + lr * (expected_err * v0[d] - reg * u0[d])).margin(1e-6));
    REQUIRE(v1[d] == Approx(v0[d] + lr * (expected_err * u0[d] - reg * v0[d])).margin(1e-6));
  }
  REQUIRE(m.has_user(1));
  REQUIRE(m.has_item(2));
}

TEST_CASE("training lazily creates missing embeddings and never skips valid examples", "[model][cf]") {
  auto m = make_model(4);
  std::vector<TrainingExample> batch;
  for (entity_id i = 0; i < 10; ++i) batch.push_back(example_factory::make_example(i, 100 + i, 1.0f, 4));
  auto report = m.train(batch);
  REQUIRE(report.applied == 10);
  REQUIRE(report.rejected == 0);
  REQUIRE(m.user_count() == 10);
  REQUIRE(m.item_count() == 10);
}

TEST_CASE("invalid examples are rejected without aborting the batch", "[model][cf][validation]") {
  auto m = make_model(4);
  std::vector<TrainingExample> batch;
  batch.push_back(example_factory::make_example(1, 1, 1.0f, 4));
  auto bad_label = example_factory::make_example(2, 2, 1.5f, 4);
  batch.push_back(bad_label);
  auto no_features = example_factory::make_example(3, 3, 0.0f, 4);
  no_features.item_features.clear();
  batch.push_back(no_features);
  batch.push_back(example_factory::make_example(4, 4, 0.0f, 4));

  auto report = m.train(batch);
  REQUIRE(report.applied == 2);
  REQUIRE(report.rejected == 2);
  REQUIRE_FALSE(m.has_user(2));
  REQUIRE(m.has_user(4));
}

TEST_CASE("initial embeddings are deterministic and not inserted by reads", "[model][cf][determinism]") {
  auto a = make_model(16);
  auto b = make_model(16);
  REQUIRE(a.get_user_embedding(5) == b.get_user_embedding(5));
  REQUIRE(a.get_user_embedding(5) == a.get_user_embedding(5));
  REQUIRE(a.user_count() == 0);

  a.initialize_user_embedding(5);
  REQUIRE(a.user_count() == 1);
  REQUIRE(a.get_user_embedding(5) == b.get_user_embedding(5));
}

TEST_CASE("repeated training on one pair reduces its error", "[model][cf]") {
  auto m = make_model(8, 0.1f, 0.0f);
  std::vector<TrainingExample> batch{example_factory::make_example(1, 1, 1.0f, 8)};
  const double before = [&] {
    m.initialize_user_embedding(1);
    m.initialize_item_embedding(1);
    return m.compute_loss(batch);
  }();
  for (int i = 0; i < 200; ++i) m.train(batch);
  REQUIRE(m.compute_loss(batch) < before);
  REQUIRE(m.compute_loss(batch) < 0.05);
}

TEST_CASE("compute_loss skips examples without stored embeddings", "[model][cf]") {
  auto m = make_model(4);
  std::vector<TrainingExample> unseen{example_factory::make_example(9, 9, 1.0f, 4)};
  REQUIRE(m.compute_loss(unseen) == 0.0);
  REQUIRE(m.user_count() == 0);

  m.train(std::vector<TrainingExample>{example_factory::make_example(1, 1, 1.0f, 4)});
  std::vector<TrainingExample> mixed{example_factory::make_example(1, 1, 1.0f, 4),
                                     example_factory::make_example(9, 9, 1.0f, 4)};
  std::vector<TrainingExample> only_known{example_factory::make_example(1, 1, 1.0f, 4)};
  REQUIRE(m.compute_loss(mixed) == Approx(m.compute_loss(only_known)));
}

TEST_CASE("snapshot and update_parameters restore the embedding population", "[model][cf][restore]") {
  auto m = make_model(4);
  std::vector<TrainingExample> batch;
  for (entity_id i = 1; i <= 5; ++i) batch.push_back(example_factory::make_example(i, i * 10, 1.0f, 4));
  m.train(batch);

  const auto now = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
  auto params = m.snapshot(now);
  REQUIRE(params.version == "v1700000000123");
  REQUIRE(params.dimension == 4);
  REQUIRE(params.users.size() == 5);
  REQUIRE(params.items.size() == 5);
  REQUIRE(params.bias_weights == std::vector<float>(4, 0.0f));

  auto fresh = make_model(4);
  REQUIRE(fresh.update_parameters(params).has_value());
  REQUIRE(fresh.user_count() == 5);
  for (entity_id i = 1; i <= 5; ++i) {
    REQUIRE(fresh.get_user_embedding(i) == m.get_user_embedding(i));
    REQUIRE(fresh.get_item_embedding(i * 10) == m.get_item_embedding(i * 10));
  }

  auto wrong_dim = make_model(8);
  auto r = wrong_dim.update_parameters(params);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::invalid_argument);

  params.version.clear();
  REQUIRE_FALSE(fresh.update_parameters(params).has_value());
}

TEST_CASE("repeated updates keep the plain gradient step", "[model][cf]") {
  const std::size_t dim = 4;
  const float lr = 0.05f, reg = 0.01f;
  auto m = make_model(dim, lr, reg);
  auto ex = example_factory::make_example(3, 7, 1.0f, dim);

  // The step never adapts: the tenth update follows the same rule as the first.
  for (int i = 0; i < 10; ++i) {
    const auto u0 = m.get_user_embedding(3);
    const auto v0 = m.get_item_embedding(7);
    const float e = 1.0f - kernels::inner_product(u0, v0);
    m.sgd_update(ex);
    const auto u1 = m.get_user_embedding(3);
    const auto v1 = m.get_item_embedding(7);
    for (std::size_t d = 0; d < dim; ++d) {
      REQUIRE(u1[d] == Approx(u0[d] + lr * (e * v0[d] - reg * u0[d])).margin(1e-6));
      REQUIRE(v1[d] == Approx(v0[d] + lr * (e * u0[d] - reg * v0[d])).margin(1e-6));
    }
  }
}

TEST_CASE("restoring parameters then training matches a model built from them", "[model][cf]") {
  auto a = make_model(4);
  std::vector<TrainingExample> batch;
  for (entity_id i = 1; i <= 4; ++i) batch.push_back(example_factory::make_example(i, i + 20, 1.0f, 4));
  a.train(batch);
  const auto params = a.snapshot(std::chrono::system_clock::now());

  auto b = make_model(4);
  REQUIRE(b.update_parameters(params).has_value());
  a.train(batch);
  b.train(batch);
  for (entity_id i = 1; i <= 4; ++i) {
    REQUIRE(a.get_user_embedding(i) == b.get_user_embedding(i));
    REQUIRE(a.get_item_embedding(i + 20) == b.get_item_embedding(i + 20));
  }
}

TEST_CASE("create rejects out-of-range configuration", "[model][cf]") {
  CollaborativeFilteringConfig cfg;
  cfg.embedding_dim = 0;
  REQUIRE_FALSE(CollaborativeFiltering::create(cfg).has_value());
  cfg.embedding_dim = 4;
  cfg.regularization = -1.0f;
  REQUIRE_FALSE(CollaborativeFiltering::create(cfg).has_value());
  cfg.regularization = 0.0f;
  cfg.learning_rate = 0.0f;
  REQUIRE_FALSE(CollaborativeFiltering::create(cfg).has_value());
}
