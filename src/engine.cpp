#include "kestrel/engine.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include "kestrel/core/scheduler.hpp"
#include "kestrel/io/checkpoint.hpp"
#include "kestrel/validation.hpp"

namespace kestrel {

using core::error_code;

struct engine::Impl {
  EngineConfig cfg;
  std::unique_ptr<model::RecommenderModel> model;
  std::unique_ptr<index::VectorIndex> users;
  std::unique_ptr<index::VectorIndex> items;
  std::unique_ptr<service::PersistentStore> store;
  std::unique_ptr<service::CheckpointSink> sink;
  service::InMemoryCheckpointSink* memory_sink{nullptr};
  std::unique_ptr<service::ChannelTransport> transport;
  std::unique_ptr<core::Scheduler> scheduler;
  std::unique_ptr<service::TrainingOrchestrator> trainer;
  std::mutex lifecycle_mutex;
  bool stopped{false};

  auto index_for(EmbeddingKind kind) -> index::VectorIndex& {
    return kind == EmbeddingKind::user ? *users : *items;
  }
  auto index_for(EmbeddingKind kind) const -> const index::VectorIndex& {
    return kind == EmbeddingKind::user ? *users : *items;
  }

  auto upsert(EmbeddingKind kind, entity_id id, std::span<const float> vec)
      -> std::expected<void, core::error> {
    auto& idx = index_for(kind);
    if (auto ok = validation::validate_embedding_dimension(vec, idx.dimension()); !ok) {
      return std::unexpected(ok.error());
    }
    if (auto r = store->put_embedding(kind, id, vec); !r) return r;
    return idx.update(id, vec);
  }
};

engine::engine(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
engine::engine(engine&&) noexcept = default;
engine& engine::operator=(engine&&) noexcept = default;
engine::~engine() = default;

auto engine::open(EngineConfig cfg, EngineCollaborators collaborators)
    -> std::expected<engine, core::error> {
  if (auto ok = validate_config(cfg); !ok) return std::unexpected(ok.error());

  auto impl = std::make_unique<Impl>();
  impl->cfg = std::move(cfg);
  const auto& c = impl->cfg;

  auto built = model::RecommenderModel::create(c.model);
  if (!built) return std::unexpected(built.error());
  impl->model = std::move(*built);

  const std::size_t dim = c.model.embedding_dim;
  auto users = index::make_vector_index(dim, c.user_index);
  if (!users) return std::unexpected(users.error());
  impl->users = std::move(*users);
  auto items = index::make_vector_index(dim, c.item_index);
  if (!items) return std::unexpected(items.error());
  impl->items = std::move(*items);

  impl->store = collaborators.store ? std::move(collaborators.store)
                                    : std::make_unique<service::InMemoryPersistentStore>();
  if (collaborators.sink) {
    impl->sink = std::move(collaborators.sink);
  } else if (!c.checkpoint_dir.empty()) {
    impl->sink = std::make_unique<service::FileCheckpointSink>(c.checkpoint_dir, c.checkpoint_keep);
  } else {
    auto sink = std::make_unique<service::InMemoryCheckpointSink>();
    impl->memory_sink = sink.get();
    impl->sink = std::move(sink);
  }

  impl->transport = std::make_unique<service::ChannelTransport>(c.training.channel_capacity);
  impl->trainer = std::make_unique<service::TrainingOrchestrator>(
      *impl->model, *impl->users, *impl->items, *impl->transport, *impl->store, *impl->sink,
      c.training);

  if (c.training.verbose) {
    std::cerr << "[engine][open] dim=" << dim << " users=" << index::to_string(c.user_index.kind)
              << " items=" << index::to_string(c.item_index.kind)
              << " checkpoints=" << (c.checkpoint_dir.empty() ? "memory" : c.checkpoint_dir.string())
              << std::endl;
  }
  return engine(std::move(impl));
}

auto engine::start() -> std::expected<void, core::error> {
  std::lock_guard lock(impl_->lifecycle_mutex);
  if (impl_->stopped) {
    return core::make_error(error_code::precondition_failed,
                            "engine was stopped; open a new one", "engine");
  }
  if (!impl_->scheduler) {
    impl_->scheduler = std::make_unique<core::Scheduler>(impl_->cfg.scheduler_threads);
  }
  return impl_->trainer->start(*impl_->scheduler);
}

auto engine::stop() -> void {
  std::lock_guard lock(impl_->lifecycle_mutex);
  if (!impl_->trainer->running()) return;
  impl_->trainer->stop();
  impl_->stopped = true;
}

auto engine::running() const -> bool { return impl_->trainer->running(); }

auto engine::publish(TrainingExample example) -> std::expected<void, core::error> {
  return impl_->transport->publish(std::move(example));
}

auto engine::train(std::span<const TrainingExample> examples)
    -> std::expected<service::FlushReport, core::error> {
  return impl_->trainer->process_batch(examples);
}

auto engine::predict(std::span<const float> user, std::span<const float> item) const
    -> std::expected<float, core::error> {
  return impl_->model->predict(user, item);
}

auto engine::search_similar(std::span<const float> query, std::size_t k, EmbeddingKind target,
                            const filter::IdFilter* exclude) const
    -> std::expected<std::vector<index::SearchHit>, core::error> {
  return impl_->index_for(target).search_similar(query, k, exclude);
}

auto engine::add_vector(entity_id id, std::span<const float> vec, EmbeddingKind target)
    -> std::expected<void, core::error> {
  return impl_->index_for(target).add(id, vec);
}

auto engine::update_vector(entity_id id, std::span<const float> vec, EmbeddingKind target)
    -> std::expected<void, core::error> {
  return impl_->index_for(target).update(id, vec);
}

auto engine::remove_vector(entity_id id, EmbeddingKind target) -> std::expected<void, core::error> {
  return impl_->index_for(target).remove(id);
}

auto engine::recommend_for_user(entity_id user, std::size_t k,
                                const filter::IdFilter* exclude) const
    -> std::expected<std::vector<index::SearchHit>, core::error> {
  const auto query = impl_->model->get_user_embedding(user);
  return impl_->items->search_similar(query, k, exclude);
}

auto engine::upsert_user_profile(const UserProfile& profile) -> std::expected<void, core::error> {
  if (auto ok = validation::validate_user_profile(profile); !ok) return ok;
  return impl_->upsert(EmbeddingKind::user, profile.user_id, profile.embedding);
}

auto engine::upsert_item_feature(const ItemFeature& feature) -> std::expected<void, core::error> {
  if (auto ok = validation::validate_item_feature(feature); !ok) return ok;
  return impl_->upsert(EmbeddingKind::item, feature.item_id, feature.embedding);
}

auto engine::snapshot_now() -> std::expected<void, core::error> {
  return impl_->trainer->snapshot_now();
}

auto engine::restore_latest_checkpoint() -> std::expected<std::string, core::error> {
  auto load = [this]() -> std::expected<ModelParameters, core::error> {
    if (!impl_->cfg.checkpoint_dir.empty()) {
      return io::load_latest_checkpoint(impl_->cfg.checkpoint_dir);
    }
    if (impl_->memory_sink == nullptr) {
      return core::make_error(error_code::unsupported,
                              "custom checkpoint sink cannot be read back", "engine");
    }
    auto latest = impl_->memory_sink->latest();
    if (!latest) return core::make_error(error_code::not_found, "no snapshot taken yet", "engine");
    return std::move(*latest);
  };

  auto params = load();
  if (!params) return std::unexpected(params.error());
  if (auto r = impl_->model->update_parameters(*params); !r) return std::unexpected(r.error());

  // Indexes only mirror model vectors when propagation uses embeddings.
  if (impl_->cfg.training.propagation == service::PropagationSource::embeddings) {
    for (const auto& rec : params->users) {
      if (auto r = impl_->users->update(rec.id, rec.values); !r) return std::unexpected(r.error());
    }
    for (const auto& rec : params->items) {
      if (auto r = impl_->items->update(rec.id, rec.values); !r) return std::unexpected(r.error());
    }
  }
  if (impl_->cfg.training.verbose) {
    std::cerr << "[engine][restore] version=" << params->version
              << " users=" << params->users.size() << " items=" << params->items.size()
              << std::endl;
  }
  return params->version;
}

auto engine::stats() const -> EngineStats {
  EngineStats s;
  s.trainer = impl_->trainer->stats();
  s.user_index_size = impl_->users->size();
  s.item_index_size = impl_->items->size();
  s.pending_examples = impl_->transport->pending();
  s.running = impl_->trainer->running();
  return s;
}

auto engine::config() const -> const EngineConfig& { return impl_->cfg; }
auto engine::model() const -> const model::RecommenderModel& { return *impl_->model; }
auto engine::user_index() const -> const index::VectorIndex& { return *impl_->users; }
auto engine::item_index() const -> const index::VectorIndex& { return *impl_->items; }
auto engine::store() -> service::PersistentStore& { return *impl_->store; }
auto engine::trainer() -> service::TrainingOrchestrator& { return *impl_->trainer; }

} // namespace kestrel
