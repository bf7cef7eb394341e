#include "kestrel/service/training_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <unordered_map>

#include "kestrel/core/platform_utils.hpp"
#include "kestrel/validation.hpp"

namespace kestrel::service {

using core::error_code;

namespace {

// Retry delay after a failed consume; doubles per consecutive failure.
constexpr std::chrono::milliseconds kMinConsumeBackoff{10};
constexpr std::chrono::milliseconds kMaxConsumeBackoff{1000};

} // namespace

TrainingOrchestrator::TrainingOrchestrator(model::RecommenderModel& model,
                                           index::VectorIndex& user_index,
                                           index::VectorIndex& item_index, Transport& transport,
                                           PersistentStore& store, CheckpointSink& sink,
                                           TrainingConfig cfg)
    : model_(model),
      user_index_(user_index),
      item_index_(item_index),
      transport_(transport),
      store_(store),
      sink_(sink),
      cfg_(cfg),
      rng_(cfg.negative_seed) {
  dbg_ = cfg_.verbose || core::env_flag("KESTREL_TRAINER_DEBUG");
}

TrainingOrchestrator::~TrainingOrchestrator() { stop(); }

auto TrainingOrchestrator::negatives_per_positive() const -> std::size_t {
  if (!(cfg_.negative_sampling_ratio > 0.0f)) return 0;
  const auto n = static_cast<std::size_t>(std::floor(cfg_.negative_sampling_ratio));
  return std::min(n, kMaxNegativesPerPositive);
}

auto TrainingOrchestrator::augment_with_negatives(std::span<const TrainingExample> batch)
    -> std::vector<TrainingExample> {
  std::vector<TrainingExample> out(batch.begin(), batch.end());
  const std::size_t per_positive = negatives_per_positive();
  if (per_positive == 0) return out;

  for (const auto& ex : batch) {
    if (!(ex.label > 0.5f)) continue;
    for (std::size_t n = 0; n < per_positive; ++n) {
      entity_id item;
      {
        std::lock_guard lock(rng_mutex_);
        item = rng_();
      }
      TrainingExample neg;
      neg.user_id = ex.user_id;
      neg.item_id = item;
      neg.label = 0.0f;
      neg.user_features = ex.user_features;
      neg.item_features = model_.get_item_embedding(item);
      neg.context_features = ex.context_features;
      neg.timestamp = ex.timestamp;
      out.push_back(std::move(neg));
    }
  }
  return out;
}

auto TrainingOrchestrator::propagate(std::span<const TrainingExample> batch, FlushReport& report)
    -> void {
  std::unordered_map<entity_id, const TrainingExample*> users;
  std::unordered_map<entity_id, const TrainingExample*> items;
  for (const auto& ex : batch) {
    users.insert_or_assign(ex.user_id, &ex);
    items.insert_or_assign(ex.item_id, &ex);
  }

  const bool use_features = cfg_.propagation == PropagationSource::features;
  auto push = [&](EmbeddingKind kind, entity_id id, const std::vector<float>& vec,
                  index::VectorIndex& idx) -> bool {
    if (auto r = store_.put_embedding(kind, id, vec); !r) {
      std::cerr << "[trainer][propagate] store update failed for " << to_string(kind) << " " << id
                << ": " << r.error().message << std::endl;
      return false;
    }
    if (auto r = idx.update(id, vec); !r) {
      std::cerr << "[trainer][propagate] index update failed for " << to_string(kind) << " " << id
                << ": " << r.error().message << std::endl;
      return false;
    }
    return true;
  };

  for (const auto& [id, ex] : users) {
    const auto vec = use_features ? ex->user_features : model_.get_user_embedding(id);
    if (push(EmbeddingKind::user, id, vec, user_index_)) ++report.propagated_users;
    else ++report.propagation_failures;
  }
  for (const auto& [id, ex] : items) {
    const auto vec = use_features ? ex->item_features : model_.get_item_embedding(id);
    if (push(EmbeddingKind::item, id, vec, item_index_)) ++report.propagated_items;
    else ++report.propagation_failures;
  }
}

auto TrainingOrchestrator::process_batch(std::span<const TrainingExample> batch)
    -> std::expected<FlushReport, core::error> {
  std::lock_guard flush_lock(flush_mutex_);
  FlushReport report;
  report.input = batch.size();
  if (batch.empty()) return report;

  std::vector<TrainingExample> valid;
  valid.reserve(batch.size());
  for (const auto& ex : batch) {
    if (auto ok = validation::validate_training_example(ex); !ok) {
      ++report.rejected;
      if (dbg_) {
        std::cerr << "[trainer][validate] rejected user=" << ex.user_id << " item=" << ex.item_id
                  << ": " << ok.error().message << std::endl;
      }
      continue;
    }
    valid.push_back(ex);
  }
  rejected_ += report.rejected;
  if (valid.empty()) {
    return core::make_error(error_code::invalid_argument,
                            "all " + std::to_string(batch.size()) + " examples rejected", "trainer");
  }

  auto augmented = augment_with_negatives(valid);
  report.negatives = augmented.size() - valid.size();

  const auto trained = model_.train(augmented);
  report.trained = trained.applied;
  report.batch_mse = trained.mean_squared_error;

  propagate(augmented, report);

  {
    std::lock_guard lock(audit_mutex_);
    audit_.insert(audit_.end(), std::make_move_iterator(augmented.begin()),
                  std::make_move_iterator(augmented.end()));
  }

  ++flushes_;
  trained_ += report.trained;
  negatives_ += report.negatives;
  propagation_failures_ += report.propagation_failures;
  if (dbg_) {
    std::cerr << "[trainer][flush] input=" << report.input << " rejected=" << report.rejected
              << " negatives=" << report.negatives << " trained=" << report.trained
              << " users=" << report.propagated_users << " items=" << report.propagated_items
              << " mse=" << report.batch_mse << std::endl;
  }
  return report;
}

auto TrainingOrchestrator::flush(std::vector<TrainingExample>& buffer) -> void {
  state_ = OrchestratorState::flushing;
  try {
    if (auto r = process_batch(buffer); !r) {
      ++failed_flushes_;
      std::cerr << "[trainer][flush] batch of " << buffer.size()
                << " failed: " << r.error().message << std::endl;
    }
  } catch (const std::exception& e) {
    ++failed_flushes_;
    std::cerr << "[trainer][flush] batch of " << buffer.size() << " threw: " << e.what()
              << std::endl;
  }
  buffer.clear();
  state_ = OrchestratorState::idle;
}

auto TrainingOrchestrator::intake_loop() -> void {
  using clock = std::chrono::steady_clock;
  std::vector<TrainingExample> buffer;
  buffer.reserve(cfg_.batch_size);
  auto last_flush = clock::now();
  auto backoff = kMinConsumeBackoff;

  while (true) {
    const auto now = clock::now();
    const auto deadline = last_flush + cfg_.batch_timeout;
    const auto wait = deadline > now
        ? std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
        : std::chrono::milliseconds(0);

    state_ = buffer.empty() ? OrchestratorState::idle : OrchestratorState::accumulating;
    auto next = transport_.consume(wait);
    if (!next) {
      if (next.error().code == error_code::cancelled) break;
      ++consume_failures_;
      std::cerr << "[trainer][intake] consume failed: " << next.error().message
                << " (retry in " << backoff.count() << "ms)" << std::endl;
      {
        std::unique_lock lock(timer_mutex_);
        timer_cv_.wait_for(lock, backoff, [this] { return stop_requested_.load(); });
      }
      backoff = std::min(backoff * 2, kMaxConsumeBackoff);
      if (stop_requested_.load()) break;
    } else {
      backoff = kMinConsumeBackoff;
    }
    if (next && *next) {
      ++received_;
      buffer.push_back(std::move(**next));
      if (buffer.size() >= cfg_.batch_size) {
        flush(buffer);
        last_flush = clock::now();
        continue;
      }
    }
    if (clock::now() - last_flush >= cfg_.batch_timeout) {
      if (!buffer.empty()) flush(buffer);
      last_flush = clock::now();
    }
  }

  if (!buffer.empty()) flush(buffer);
  state_ = OrchestratorState::stopped;
}

auto TrainingOrchestrator::snapshot_now() -> std::expected<void, core::error> {
  auto params = model_.snapshot();
  if (auto r = sink_.save(params); !r) {
    ++failed_snapshots_;
    return std::unexpected(r.error());
  }
  ++snapshots_;
  {
    std::lock_guard lock(snapshot_time_mutex_);
    last_snapshot_at_ = params.updated_at;
  }
  if (dbg_) {
    std::cerr << "[trainer][snapshot] saved " << params.version << " users=" << params.users.size()
              << " items=" << params.items.size() << std::endl;
  }
  return {};
}

auto TrainingOrchestrator::snapshot_loop() -> void {
  std::unique_lock lock(timer_mutex_);
  while (!stop_requested_.load()) {
    if (timer_cv_.wait_for(lock, cfg_.model_save_interval,
                           [this] { return stop_requested_.load(); })) {
      break;
    }
    lock.unlock();
    try {
      if (auto r = snapshot_now(); !r) {
        std::cerr << "[trainer][snapshot] failed: " << r.error().message << std::endl;
      }
    } catch (const std::exception& e) {
      ++failed_snapshots_;
      std::cerr << "[trainer][snapshot] threw: " << e.what() << std::endl;
    }
    lock.lock();
  }
}

auto TrainingOrchestrator::start(core::Scheduler& scheduler) -> std::expected<void, core::error> {
  if (running_.load()) {
    return core::make_error(error_code::precondition_failed, "trainer already running", "trainer");
  }
  if (scheduler.stopping()) {
    return core::make_error(error_code::unavailable, "scheduler is stopped", "trainer");
  }
  if (scheduler.num_threads() < 2) {
    return core::make_error(error_code::resource_exhausted,
                            "trainer needs a scheduler with at least two workers", "trainer");
  }
  if (auto ok = validation::validate_batch_size(cfg_.batch_size); !ok) {
    return core::make_error(error_code::config_invalid, ok.error().message, "trainer");
  }

  stop_requested_ = false;
  intake_task_ = scheduler.submit([this] { intake_loop(); });
  snapshot_task_ = scheduler.submit([this] { snapshot_loop(); });
  running_ = true;
  if (dbg_) {
    std::cerr << "[trainer][start] batch_size=" << cfg_.batch_size
              << " timeout_ms=" << cfg_.batch_timeout.count()
              << " save_interval_ms=" << cfg_.model_save_interval.count() << std::endl;
  }
  return {};
}

auto TrainingOrchestrator::stop() -> void {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard lock(timer_mutex_);
    stop_requested_ = true;
  }
  timer_cv_.notify_all();
  transport_.close();

  for (auto* task : {&intake_task_, &snapshot_task_}) {
    if (!task->valid()) continue;
    try {
      task->get();
    } catch (const std::exception& e) {
      std::cerr << "[trainer][stop] worker exited with: " << e.what() << std::endl;
    }
  }
  state_ = OrchestratorState::stopped;
}

auto TrainingOrchestrator::stats() const -> OrchestratorStats {
  OrchestratorStats s;
  s.received = received_.load();
  s.rejected = rejected_.load();
  s.flushes = flushes_.load();
  s.failed_flushes = failed_flushes_.load();
  s.consume_failures = consume_failures_.load();
  s.examples_trained = trained_.load();
  s.negatives_generated = negatives_.load();
  s.propagation_failures = propagation_failures_.load();
  s.snapshots = snapshots_.load();
  s.failed_snapshots = failed_snapshots_.load();
  s.audit_size = audit_size();
  s.user_embeddings = model_.user_count();
  s.item_embeddings = model_.item_count();
  {
    std::lock_guard lock(snapshot_time_mutex_);
    s.last_snapshot_at = last_snapshot_at_;
  }
  return s;
}

auto TrainingOrchestrator::audit_size() const -> std::size_t {
  std::lock_guard lock(audit_mutex_);
  return audit_.size();
}

auto TrainingOrchestrator::audit_log() const -> std::vector<TrainingExample> {
  std::lock_guard lock(audit_mutex_);
  return audit_;
}

auto TrainingOrchestrator::clear_audit_buffer() -> std::size_t {
  std::lock_guard lock(audit_mutex_);
  const std::size_t n = audit_.size();
  audit_.clear();
  return n;
}

} // namespace kestrel::service
