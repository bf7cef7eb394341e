#pragma once

/** \file training_orchestrator.hpp
 *  \brief Streams examples from a Transport into mini-batch model updates.
 *
 * Pipeline per flush:
 *  1. negative augmentation: min(floor(ratio), 5) negatives per example with
 *     label > 0.5 (same user, random item id, freshly initialized item
 *     features, label 0)
 *  2. model training on originals plus negatives (model lock held exclusively)
 *  3. propagation of each distinct id's last-seen vector to the
 *     PersistentStore and then to the user/item VectorIndex
 *  4. append to the audit buffer
 *
 * A flush fires when the buffer reaches batch_size or batch_timeout elapses
 * since the previous flush, whichever comes first. A separate loop hands a
 * ModelParameters snapshot to the CheckpointSink every model_save_interval.
 * Failed flushes and snapshots are logged and counted; the loops keep going.
 *
 * Lock order: flush mutex, then model lock, then index lock. The model lock
 * is released before any index is touched.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <vector>

#include "kestrel/core/scheduler.hpp"
#include "kestrel/error.hpp"
#include "kestrel/index/vector_index.hpp"
#include "kestrel/model/recommender_model.hpp"
#include "kestrel/service/collaborators.hpp"
#include "kestrel/types.hpp"

namespace kestrel::service {

inline constexpr std::size_t kMaxNegativesPerPositive = 5;

/** \brief Which vector is written to the store and indexes after training. */
enum class PropagationSource : std::uint8_t {
  features,    /**< the example's user/item feature vectors */
  embeddings,  /**< the model's trained embeddings */
};

/** \brief Trainer settings. */
struct TrainingConfig {
  std::size_t batch_size{1024};
  std::chrono::milliseconds batch_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds model_save_interval{std::chrono::seconds(3600)};
  float negative_sampling_ratio{4.0f};
  std::size_t channel_capacity{1000};
  PropagationSource propagation{PropagationSource::features};
  std::uint64_t negative_seed{0x6b657374726c0001ull};
  bool verbose{false};
};

enum class OrchestratorState : std::uint8_t { idle, accumulating, flushing, stopped };

/** \brief Outcome of one process_batch() call. */
struct FlushReport {
  std::size_t input{0};
  std::size_t rejected{0};
  std::size_t negatives{0};
  std::size_t trained{0};
  std::size_t propagated_users{0};
  std::size_t propagated_items{0};
  std::size_t propagation_failures{0};
  double batch_mse{0.0};
};

/** \brief Cumulative counters. */
struct OrchestratorStats {
  std::uint64_t received{0};
  std::uint64_t rejected{0};
  std::uint64_t flushes{0};
  std::uint64_t failed_flushes{0};
  std::uint64_t consume_failures{0};  /**< transport errors other than cancellation */
  std::uint64_t examples_trained{0};
  std::uint64_t negatives_generated{0};
  std::uint64_t propagation_failures{0};
  std::uint64_t snapshots{0};
  std::uint64_t failed_snapshots{0};
  std::size_t audit_size{0};
  std::size_t user_embeddings{0};
  std::size_t item_embeddings{0};
  std::optional<time_point> last_snapshot_at;
};

class TrainingOrchestrator {
public:
  TrainingOrchestrator(model::RecommenderModel& model, index::VectorIndex& user_index,
                       index::VectorIndex& item_index, Transport& transport,
                       PersistentStore& store, CheckpointSink& sink, TrainingConfig cfg);
  ~TrainingOrchestrator();

  TrainingOrchestrator(const TrainingOrchestrator&) = delete;
  TrainingOrchestrator& operator=(const TrainingOrchestrator&) = delete;

  /** \brief Launch the intake and snapshot loops; needs two free workers. */
  auto start(core::Scheduler& scheduler) -> std::expected<void, core::error>;

  /** \brief Close the transport, flush what is buffered and join both loops. */
  auto stop() -> void;

  [[nodiscard]] auto running() const noexcept -> bool { return running_.load(); }

  /** \brief Run the full flush pipeline on `batch` synchronously. */
  auto process_batch(std::span<const TrainingExample> batch)
      -> std::expected<FlushReport, core::error>;

  /** \brief `batch` followed by its synthesized negatives. */
  auto augment_with_negatives(std::span<const TrainingExample> batch)
      -> std::vector<TrainingExample>;

  /** \brief Snapshot the model and hand it to the sink now. */
  auto snapshot_now() -> std::expected<void, core::error>;

  [[nodiscard]] auto state() const noexcept -> OrchestratorState { return state_.load(); }
  [[nodiscard]] auto stats() const -> OrchestratorStats;
  [[nodiscard]] auto config() const noexcept -> const TrainingConfig& { return cfg_; }

  [[nodiscard]] auto audit_size() const -> std::size_t;
  [[nodiscard]] auto audit_log() const -> std::vector<TrainingExample>;
  /** \brief Drop the audit buffer; returns how many examples it held. */
  auto clear_audit_buffer() -> std::size_t;

private:
  auto intake_loop() -> void;
  auto snapshot_loop() -> void;
  auto flush(std::vector<TrainingExample>& buffer) -> void;
  auto propagate(std::span<const TrainingExample> batch, FlushReport& report) -> void;
  auto negatives_per_positive() const -> std::size_t;

  model::RecommenderModel& model_;
  index::VectorIndex& user_index_;
  index::VectorIndex& item_index_;
  Transport& transport_;
  PersistentStore& store_;
  CheckpointSink& sink_;
  TrainingConfig cfg_;
  bool dbg_{false};

  std::mutex flush_mutex_;
  std::mutex rng_mutex_;
  std::mt19937_64 rng_;

  mutable std::mutex audit_mutex_;
  std::vector<TrainingExample> audit_;

  std::atomic<OrchestratorState> state_{OrchestratorState::idle};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  std::future<void> intake_task_;
  std::future<void> snapshot_task_;

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> flushes_{0};
  std::atomic<std::uint64_t> failed_flushes_{0};
  std::atomic<std::uint64_t> consume_failures_{0};
  std::atomic<std::uint64_t> trained_{0};
  std::atomic<std::uint64_t> negatives_{0};
  std::atomic<std::uint64_t> propagation_failures_{0};
  std::atomic<std::uint64_t> snapshots_{0};
  std::atomic<std::uint64_t> failed_snapshots_{0};
  mutable std::mutex snapshot_time_mutex_;
  std::optional<time_point> last_snapshot_at_;
};

} // namespace kestrel::service
