#pragma once

/** \file collaborators.hpp
 *  \brief Interfaces to the systems around the trainer plus in-process implementations.
 *
 * - Transport: source of TrainingExamples (message broker in production).
 * - PersistentStore: durable home of the latest user/item vectors.
 * - CheckpointSink: receives periodic ModelParameters snapshots.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "kestrel/core/bounded_channel.hpp"
#include "kestrel/error.hpp"
#include "kestrel/types.hpp"

namespace kestrel::service {

class Transport {
public:
  virtual ~Transport() = default;

  /** \brief Hand one example to the trainer; blocks while the intake is full. */
  virtual auto publish(TrainingExample example) -> std::expected<void, core::error> = 0;

  /** \brief Next example, std::nullopt on timeout, `cancelled` once closed and drained. */
  virtual auto consume(std::chrono::milliseconds timeout)
      -> std::expected<std::optional<TrainingExample>, core::error> = 0;

  /** \brief Stop accepting publishes and wake blocked consumers. */
  virtual auto close() -> void = 0;
};

/** \brief In-process transport over a bounded channel. */
class ChannelTransport final : public Transport {
public:
  explicit ChannelTransport(std::size_t capacity) : channel_(capacity) {}

  auto publish(TrainingExample example) -> std::expected<void, core::error> override;
  auto consume(std::chrono::milliseconds timeout)
      -> std::expected<std::optional<TrainingExample>, core::error> override;
  auto close() -> void override { channel_.close(); }

  [[nodiscard]] auto pending() const -> std::size_t { return channel_.size(); }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return channel_.capacity(); }

private:
  core::BoundedChannel<TrainingExample> channel_;
};

class PersistentStore {
public:
  virtual ~PersistentStore() = default;

  virtual auto get_embedding(EmbeddingKind kind, entity_id id)
      -> std::expected<std::optional<std::vector<float>>, core::error> = 0;

  virtual auto put_embedding(EmbeddingKind kind, entity_id id, std::span<const float> values)
      -> std::expected<void, core::error> = 0;
};

class InMemoryPersistentStore final : public PersistentStore {
public:
  auto get_embedding(EmbeddingKind kind, entity_id id)
      -> std::expected<std::optional<std::vector<float>>, core::error> override;
  auto put_embedding(EmbeddingKind kind, entity_id id, std::span<const float> values)
      -> std::expected<void, core::error> override;

  [[nodiscard]] auto size(EmbeddingKind kind) const -> std::size_t;

private:
  mutable std::mutex mutex_;
  std::unordered_map<entity_id, std::vector<float>> users_;
  std::unordered_map<entity_id, std::vector<float>> items_;
};

class CheckpointSink {
public:
  virtual ~CheckpointSink() = default;
  virtual auto save(const ModelParameters& params) -> std::expected<void, core::error> = 0;
};

/** \brief Writes checkpoint files and keeps the newest `keep_last`. */
class FileCheckpointSink final : public CheckpointSink {
public:
  FileCheckpointSink(std::filesystem::path dir, std::size_t keep_last = 5, int zstd_level = -1)
      : dir_(std::move(dir)), keep_last_(keep_last), zstd_level_(zstd_level) {}

  auto save(const ModelParameters& params) -> std::expected<void, core::error> override;

  [[nodiscard]] auto directory() const -> const std::filesystem::path& { return dir_; }

private:
  std::filesystem::path dir_;
  std::size_t keep_last_;
  int zstd_level_;
};

/** \brief Keeps every saved snapshot in memory. */
class InMemoryCheckpointSink final : public CheckpointSink {
public:
  auto save(const ModelParameters& params) -> std::expected<void, core::error> override;

  [[nodiscard]] auto count() const -> std::size_t;
  [[nodiscard]] auto latest() const -> std::optional<ModelParameters>;

private:
  mutable std::mutex mutex_;
  std::vector<ModelParameters> saved_;
};

} // namespace kestrel::service
