#include <catch2/catch_all.hpp>

#include <algorithm>
#include <chrono>
#include <vector>

#include "kestrel/engine.hpp"
#include "tests/support/example_factory.hpp"

using namespace kestrel;
using namespace std::chrono_literals;

namespace {

constexpr std::size_t kDim = 8;

auto small_config() -> EngineConfig {
  EngineConfig cfg;
  cfg.model.embedding_dim = kDim;
  cfg.model.learning_rate = 0.05f;
  cfg.training.batch_size = 16;
  cfg.training.batch_timeout = 10s;
  cfg.training.model_save_interval = 1h;
  cfg.training.negative_sampling_ratio = 0.0f;
  return cfg;
}

auto open_engine(EngineConfig cfg = small_config()) -> engine {
  auto e = engine::open(std::move(cfg));
  REQUIRE(e.has_value());
  return std::move(*e);
}

auto item_feature(entity_id id, std::uint64_t seed) -> ItemFeature {
  ItemFeature f;
  f.item_id = id;
  f.embedding = example_factory::random_vector(kDim, seed);
  f.category = "news";
  f.popularity_score = 0.3f;
  return f;
}

auto contains_id(const std::vector<index::SearchHit>& hits, entity_id id) -> bool {
  return std::any_of(hits.begin(), hits.end(), [id](const index::SearchHit& h) { return h.id == id; });
}

} // namespace

TEST_CASE("open validates the configuration", "[engine]") {
  auto cfg = small_config();
  cfg.model.embedding_dim = 0;
  auto e = engine::open(cfg);
  REQUIRE_FALSE(e.has_value());
  REQUIRE(e.error().code == core::error_code::config_invalid);

  auto threads = small_config();
  threads.scheduler_threads = 1;
  REQUIRE_FALSE(engine::open(threads).has_value());
}

TEST_CASE("open builds the configured index kinds", "[engine]") {
  auto cfg = small_config();
  cfg.user_index.kind = index::IndexKind::graph;
  auto e = open_engine(cfg);
  REQUIRE(e.user_index().kind() == index::IndexKind::graph);
  REQUIRE(e.item_index().kind() == index::IndexKind::linear);
  REQUIRE(e.user_index().dimension() == kDim);
  REQUIRE(e.model().dimension() == kDim);
  REQUIRE_FALSE(e.running());
}

TEST_CASE("train updates the model, the store and both indexes", "[engine]") {
  auto e = open_engine();
  std::vector<TrainingExample> batch;
  for (entity_id u = 1; u <= 4; ++u) {
    batch.push_back(example_factory::make_example(u, 100 + u, 1.0f, kDim));
  }
  auto report = e.train(batch);
  REQUIRE(report.has_value());
  REQUIRE(report->trained == 4);

  auto stats = e.stats();
  REQUIRE(stats.user_index_size == 4);
  REQUIRE(stats.item_index_size == 4);
  REQUIRE(stats.trainer.flushes == 1);
  REQUIRE(e.model().user_count() == 4);

  auto stored = e.store().get_embedding(EmbeddingKind::item, 103);
  REQUIRE(stored.has_value());
  REQUIRE(stored->has_value());
  REQUIRE(**stored == batch[2].item_features);

  auto hits = e.search_similar(batch[2].item_features, 1);
  REQUIRE(hits.has_value());
  REQUIRE(hits->front().id == 103);
  auto user_hits = e.search_similar(batch[0].user_features, 1, EmbeddingKind::user);
  REQUIRE(user_hits.has_value());
  REQUIRE(user_hits->front().id == 1);
}

TEST_CASE("predict scores caller vectors", "[engine]") {
  auto e = open_engine();
  std::vector<float> u(kDim, 0.5f);
  std::vector<float> i(kDim, 0.5f);
  auto s = e.predict(u, i);
  REQUIRE(s.has_value());
  REQUIRE(*s > 0.5f);
  std::vector<float> short_vec(kDim - 1, 0.5f);
  REQUIRE_FALSE(e.predict(short_vec, i).has_value());
}

TEST_CASE("recommend_for_user honours the exclusion filter", "[engine]") {
  auto cfg = small_config();
  cfg.training.propagation = service::PropagationSource::embeddings;
  auto e = open_engine(cfg);
  for (entity_id id = 1; id <= 20; ++id) REQUIRE(e.upsert_item_feature(item_feature(id, id)).has_value());

  std::vector<TrainingExample> batch{example_factory::make_example(7, 3, 1.0f, kDim),
                                     example_factory::make_example(7, 4, 1.0f, kDim)};
  REQUIRE(e.train(batch).has_value());

  auto all = e.recommend_for_user(7, 25);
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 20);

  filter::IdFilter seen{3, 4};
  auto recs = e.recommend_for_user(7, 25, &seen);
  REQUIRE(recs.has_value());
  REQUIRE(recs->size() == 18);
  REQUIRE_FALSE(contains_id(*recs, 3));
  REQUIRE_FALSE(contains_id(*recs, 4));

  auto none = e.recommend_for_user(7, 0);
  REQUIRE(none.has_value());
  REQUIRE(none->empty());
}

TEST_CASE("upserts validate before writing", "[engine]") {
  auto e = open_engine();

  SECTION("item feature") {
    REQUIRE(e.upsert_item_feature(item_feature(1, 1)).has_value());
    REQUIRE(e.item_index().contains(1));
    auto updated = item_feature(1, 99);
    REQUIRE(e.upsert_item_feature(updated).has_value());
    REQUIRE(e.item_index().size() == 1);
    auto stored = e.store().get_embedding(EmbeddingKind::item, 1);
    REQUIRE(**stored == updated.embedding);

    auto bad = item_feature(2, 2);
    bad.category.clear();
    auto r = e.upsert_item_feature(bad);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_argument);
    REQUIRE_FALSE(e.item_index().contains(2));
    REQUIRE_FALSE(e.store().get_embedding(EmbeddingKind::item, 2)->has_value());
  }

  SECTION("wrong dimension") {
    auto wide = item_feature(3, 3);
    wide.embedding.push_back(1.0f);
    auto r = e.upsert_item_feature(wide);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_argument);
    REQUIRE_FALSE(e.store().get_embedding(EmbeddingKind::item, 3)->has_value());
  }

  SECTION("user profile") {
    UserProfile p;
    p.user_id = 11;
    p.embedding = example_factory::random_vector(kDim, 11);
    p.preferences = {{"jazz", 0.9f}};
    REQUIRE(e.upsert_user_profile(p).has_value());
    REQUIRE(e.user_index().contains(11));
    REQUIRE_FALSE(e.item_index().contains(11));

    p.preferences.push_back({"", 0.1f});
    REQUIRE_FALSE(e.upsert_user_profile(p).has_value());
  }
}

TEST_CASE("vector operations address the requested index", "[engine]") {
  auto e = open_engine();
  const auto v = example_factory::random_vector(kDim, 5);
  REQUIRE(e.add_vector(5, v, EmbeddingKind::user).has_value());
  REQUIRE(e.user_index().contains(5));
  REQUIRE_FALSE(e.item_index().contains(5));

  REQUIRE(e.add_vector(6, v).has_value());
  REQUIRE(e.item_index().contains(6));

  const auto w = example_factory::random_vector(kDim, 6);
  REQUIRE(e.update_vector(6, w).has_value());
  auto hits = e.search_similar(w, 1);
  REQUIRE(hits.has_value());
  REQUIRE(hits->front().id == 6);
  REQUIRE(hits->front().score == Catch::Approx(1.0f).margin(1e-5));

  REQUIRE(e.remove_vector(5, EmbeddingKind::user).has_value());
  REQUIRE_FALSE(e.user_index().contains(5));
  REQUIRE(e.remove_vector(5, EmbeddingKind::user).has_value());

  std::vector<float> short_vec(kDim - 2, 1.0f);
  REQUIRE_FALSE(e.add_vector(7, short_vec).has_value());
}

TEST_CASE("in-memory snapshots restore the model", "[engine][checkpoint]") {
  auto e = open_engine();

  auto missing = e.restore_latest_checkpoint();
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::not_found);

  std::vector<TrainingExample> batch{example_factory::make_example(1, 10, 1.0f, kDim)};
  REQUIRE(e.train(batch).has_value());
  const auto saved_user = e.model().get_user_embedding(1);
  REQUIRE(e.snapshot_now().has_value());

  for (int i = 0; i < 5; ++i) REQUIRE(e.train(batch).has_value());
  REQUIRE(e.model().get_user_embedding(1) != saved_user);

  auto version = e.restore_latest_checkpoint();
  REQUIRE(version.has_value());
  REQUIRE(version->front() == 'v');
  REQUIRE(e.model().get_user_embedding(1) == saved_user);
  REQUIRE(e.stats().trainer.snapshots == 1);
}

TEST_CASE("file checkpoints survive reopening", "[engine][checkpoint]") {
  example_factory::TempDir tmp("engine_ckpt");
  auto cfg = small_config();
  cfg.checkpoint_dir = tmp.path();
  cfg.training.propagation = service::PropagationSource::embeddings;

  std::vector<float> saved_item;
  {
    auto e = open_engine(cfg);
    std::vector<TrainingExample> batch{example_factory::make_example(1, 10, 1.0f, kDim),
                                       example_factory::make_example(2, 20, 0.0f, kDim)};
    REQUIRE(e.train(batch).has_value());
    saved_item = e.model().get_item_embedding(20);
    REQUIRE(e.snapshot_now().has_value());
  }
  REQUIRE(std::filesystem::exists(tmp.path() / io::kCurrentPointer));

  auto fresh = open_engine(cfg);
  REQUIRE(fresh.item_index().size() == 0);
  auto version = fresh.restore_latest_checkpoint();
  REQUIRE(version.has_value());
  REQUIRE(fresh.model().item_count() == 2);
  REQUIRE(fresh.model().get_item_embedding(20) == saved_item);
  REQUIRE(fresh.item_index().size() == 2);
  REQUIRE(fresh.user_index().size() == 2);
  auto hits = fresh.search_similar(saved_item, 1);
  REQUIRE(hits.has_value());
  REQUIRE(hits->front().id == 20);
}

TEST_CASE("an injected sink cannot be restored from", "[engine][checkpoint]") {
  EngineCollaborators parts;
  parts.sink = std::make_unique<service::InMemoryCheckpointSink>();
  auto e = engine::open(small_config(), std::move(parts));
  REQUIRE(e.has_value());
  REQUIRE(e->snapshot_now().has_value());
  auto r = e->restore_latest_checkpoint();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::unsupported);
}

TEST_CASE("streaming lifecycle drains on stop", "[engine][streaming]") {
  auto cfg = small_config();
  cfg.training.batch_size = 3;
  auto e = open_engine(cfg);
  REQUIRE(e.start().has_value());
  REQUIRE(e.running());
  REQUIRE(e.stats().running);

  for (entity_id u = 1; u <= 7; ++u) {
    REQUIRE(e.publish(example_factory::make_example(u, u + 50, 1.0f, kDim)).has_value());
  }
  e.stop();
  REQUIRE_FALSE(e.running());

  auto stats = e.stats();
  REQUIRE(stats.trainer.received == 7);
  REQUIRE(stats.trainer.examples_trained == 7);
  REQUIRE(stats.trainer.flushes == 3);
  REQUIRE(stats.user_index_size == 7);
  REQUIRE(stats.pending_examples == 0);

  auto again = e.start();
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.error().code == core::error_code::precondition_failed);
  REQUIRE_FALSE(e.publish(example_factory::make_example(9, 9, 1.0f, kDim)).has_value());

  // Synchronous training still works after the stream is closed.
  std::vector<TrainingExample> batch{example_factory::make_example(8, 58, 1.0f, kDim)};
  REQUIRE(e.train(batch).has_value());
  REQUIRE(e.user_index().size() == 8);
}

TEST_CASE("engine is movable", "[engine]") {
  auto e = open_engine();
  REQUIRE(e.add_vector(1, example_factory::random_vector(kDim, 1)).has_value());
  engine moved = std::move(e);
  REQUIRE(moved.item_index().contains(1));
}
