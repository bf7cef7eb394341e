#include "kestrel/service/collaborators.hpp"

#include <iostream>

#include "kestrel/io/checkpoint.hpp"

namespace kestrel::service {

using core::error_code;

auto ChannelTransport::publish(TrainingExample example) -> std::expected<void, core::error> {
  if (!channel_.send(std::move(example))) {
    return core::make_error(error_code::unavailable, "transport closed", "transport");
  }
  return {};
}

auto ChannelTransport::consume(std::chrono::milliseconds timeout)
    -> std::expected<std::optional<TrainingExample>, core::error> {
  TrainingExample out;
  switch (channel_.receive_for(out, timeout)) {
    case core::channel_status::ok: return std::optional<TrainingExample>(std::move(out));
    case core::channel_status::timeout: return std::optional<TrainingExample>{};
    case core::channel_status::closed: break;
  }
  return core::make_error(error_code::cancelled, "transport closed", "transport");
}

auto InMemoryPersistentStore::get_embedding(EmbeddingKind kind, entity_id id)
    -> std::expected<std::optional<std::vector<float>>, core::error> {
  std::lock_guard lock(mutex_);
  const auto& table = kind == EmbeddingKind::user ? users_ : items_;
  auto it = table.find(id);
  if (it == table.end()) return std::optional<std::vector<float>>{};
  return std::optional<std::vector<float>>(it->second);
}

auto InMemoryPersistentStore::put_embedding(EmbeddingKind kind, entity_id id,
                                            std::span<const float> values)
    -> std::expected<void, core::error> {
  std::lock_guard lock(mutex_);
  auto& table = kind == EmbeddingKind::user ? users_ : items_;
  table.insert_or_assign(id, std::vector<float>(values.begin(), values.end()));
  return {};
}

auto InMemoryPersistentStore::size(EmbeddingKind kind) const -> std::size_t {
  std::lock_guard lock(mutex_);
  return kind == EmbeddingKind::user ? users_.size() : items_.size();
}

auto FileCheckpointSink::save(const ModelParameters& params) -> std::expected<void, core::error> {
  auto path = io::save_checkpoint(dir_, params, zstd_level_);
  if (!path) return std::unexpected(path.error());
  if (keep_last_ > 0) {
    if (auto pruned = io::prune_checkpoints(dir_, keep_last_); !pruned) {
      std::cerr << "[checkpoint][prune] " << pruned.error().message << std::endl;
    }
  }
  return {};
}

auto InMemoryCheckpointSink::save(const ModelParameters& params) -> std::expected<void, core::error> {
  std::lock_guard lock(mutex_);
  saved_.push_back(params);
  return {};
}

auto InMemoryCheckpointSink::count() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return saved_.size();
}

auto InMemoryCheckpointSink::latest() const -> std::optional<ModelParameters> {
  std::lock_guard lock(mutex_);
  if (saved_.empty()) return std::nullopt;
  return saved_.back();
}

} // namespace kestrel::service
