#include <catch2/catch_all.hpp>

#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

#include "kestrel/model/recommender_model.hpp"
#include "tests/support/example_factory.hpp"

using namespace kestrel;
using model::RecommenderModel;

namespace {

auto make_model(std::size_t dim) -> std::unique_ptr<RecommenderModel> {
  model::CollaborativeFilteringConfig cfg;
  cfg.embedding_dim = dim;
  cfg.learning_rate = 0.05f;
  auto m = RecommenderModel::create(cfg);
  REQUIRE(m.has_value());
  return std::move(*m);
}

} // namespace

TEST_CASE("recommender model dispatches to collaborative filtering", "[model]") {
  auto m = make_model(4);
  REQUIRE(std::string(m->algorithm_name()) == "collaborative_filtering");
  REQUIRE(m->dimension() == 4);
  REQUIRE(m->predict(std::vector<float>{1, 1}, std::vector<float>{1, 1}).value() == 2.0f);

  std::vector<TrainingExample> batch{example_factory::make_example(1, 2, 1.0f, 4)};
  auto report = m->train(batch);
  REQUIRE(report.applied == 1);
  REQUIRE(m->user_count() == 1);
  REQUIRE(m->item_count() == 1);
  REQUIRE(m->get_user_embedding(1).size() == 4);
}

TEST_CASE("create propagates configuration errors", "[model]") {
  model::CollaborativeFilteringConfig cfg;
  cfg.embedding_dim = 0;
  auto m = RecommenderModel::create(cfg);
  REQUIRE_FALSE(m.has_value());
  REQUIRE(m.error().code == core::error_code::config_invalid);
}

TEST_CASE("snapshot restores into another model", "[model][restore]") {
  auto a = make_model(8);
  std::vector<TrainingExample> batch;
  for (entity_id i = 0; i < 20; ++i) batch.push_back(example_factory::make_example(i, i + 100, 1.0f, 8));
  a->train(batch);

  auto params = a->snapshot();
  auto b = make_model(8);
  REQUIRE(b->update_parameters(params).has_value());
  REQUIRE(b->user_count() == 20);
  REQUIRE(b->compute_loss(batch) == Catch::Approx(a->compute_loss(batch)));
}

TEST_CASE("concurrent readers see whole vectors while training runs", "[model][concurrency]") {
  constexpr std::size_t dim = 16;
  auto m = make_model(dim);
  std::atomic<bool> done{false};
  std::atomic<std::size_t> reads{0};
  std::atomic<std::size_t> bad{0};

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      while (!done.load()) {
        auto u = m->get_user_embedding(1);
        auto i = m->get_item_embedding(1);
        auto s = m->predict(u, i);
        if (u.size() != dim || !s || !std::isfinite(*s)) bad.fetch_add(1);
        reads.fetch_add(1);
      }
    });
  }

  std::vector<TrainingExample> batch;
  for (int i = 0; i < 64; ++i) batch.push_back(example_factory::make_example(1, 1, 1.0f, dim));
  for (int round = 0; round < 50; ++round) {
    auto report = m->train(batch);
    REQUIRE(report.applied == batch.size());
  }
  while (reads.load() == 0) std::this_thread::yield();
  done = true;
  for (auto& t : readers) t.join();
  REQUIRE(bad.load() == 0);
  REQUIRE(m->user_count() == 1);
}
