#include "kestrel/config.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "kestrel/core/platform_utils.hpp"
#include "kestrel/validation.hpp"

namespace kestrel {

using core::error_code;

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::make_error(error_code::config_invalid, std::move(message), "config");
}

auto env_value(const char* name) -> std::optional<std::string> {
  auto raw = core::safe_getenv(name);
  if (!raw || raw->empty()) return std::nullopt;
  return raw;
}

template <typename T>
auto overlay_number(const char* name, T& target) -> std::expected<void, core::error> {
  auto raw = env_value(name);
  if (!raw) return {};
  auto value = core::parse_number<T>(*raw);
  if (!value) return invalid(std::string(name) + "=" + *raw + " is not a valid number");
  target = *value;
  return {};
}

template <typename Duration>
auto overlay_duration(const char* name, std::chrono::milliseconds& target)
    -> std::expected<void, core::error> {
  std::uint64_t count = 0;
  auto raw = env_value(name);
  if (!raw) return {};
  if (auto r = overlay_number(name, count); !r) return r;
  target = std::chrono::duration_cast<std::chrono::milliseconds>(
      Duration(static_cast<typename Duration::rep>(count)));
  return {};
}

auto overlay_bool(const char* name, bool& target) -> std::expected<void, core::error> {
  auto raw = env_value(name);
  if (!raw) return {};
  if (*raw == "1" || *raw == "true" || *raw == "on") {
    target = true;
  } else if (*raw == "0" || *raw == "false" || *raw == "off") {
    target = false;
  } else {
    return invalid(std::string(name) + "=" + *raw + " is not a boolean");
  }
  return {};
}

template <typename T, typename Parser>
auto overlay_enum(const char* name, T& target, Parser parse) -> std::expected<void, core::error> {
  auto raw = env_value(name);
  if (!raw) return {};
  auto value = parse(*raw);
  if (!value) return invalid(std::string(name) + ": " + value.error().message);
  target = *value;
  return {};
}

auto parse_propagation(std::string_view text)
    -> std::expected<service::PropagationSource, core::error> {
  if (text == "features") return service::PropagationSource::features;
  if (text == "embeddings") return service::PropagationSource::embeddings;
  return invalid("unknown propagation source: " + std::string(text));
}

auto validate_index(const index::IndexConfig& cfg, const char* which)
    -> std::expected<void, core::error> {
  if (cfg.kind != index::IndexKind::graph) return {};
  const auto& g = cfg.graph;
  if (g.M < 2) return invalid(std::string(which) + ": graph M must be >= 2");
  if (g.ef_construction == 0) return invalid(std::string(which) + ": ef_construction must be > 0");
  if (g.ef_search == 0) return invalid(std::string(which) + ": ef_search must be > 0");
  if (g.max_level > index::kMaxGraphLevel) {
    return invalid(std::string(which) + ": max_level must be <= 16");
  }
  if (!(g.level_probability > 0.0 && g.level_probability < 1.0)) {
    return invalid(std::string(which) + ": level_probability must be in (0, 1)");
  }
  return {};
}

} // namespace

auto validate_config(const EngineConfig& cfg) -> std::expected<void, core::error> {
  const auto& m = cfg.model;
  if (m.embedding_dim == 0 || m.embedding_dim > validation::kMaxEmbeddingDimension) {
    return invalid("embedding_dim must be in [1, 2048]");
  }
  if (!(std::isfinite(m.learning_rate) && m.learning_rate > 0.0f)) {
    return invalid("learning_rate must be a positive finite number");
  }
  if (!(std::isfinite(m.regularization) && m.regularization >= 0.0f)) {
    return invalid("regularization must be a non-negative finite number");
  }

  const auto& t = cfg.training;
  if (auto ok = validation::validate_batch_size(t.batch_size); !ok) {
    return invalid(ok.error().message);
  }
  if (t.batch_timeout.count() <= 0) return invalid("batch_timeout must be > 0");
  if (t.model_save_interval.count() <= 0) return invalid("model_save_interval must be > 0");
  if (!(std::isfinite(t.negative_sampling_ratio) && t.negative_sampling_ratio >= 0.0f)) {
    return invalid("negative_sampling_ratio must be a non-negative finite number");
  }
  if (t.channel_capacity == 0) return invalid("channel_capacity must be > 0");

  if (auto ok = validate_index(cfg.user_index, "user_index"); !ok) return ok;
  if (auto ok = validate_index(cfg.item_index, "item_index"); !ok) return ok;

  if (cfg.checkpoint_keep == 0) return invalid("checkpoint_keep must be > 0");
  if (cfg.scheduler_threads < 2) return invalid("scheduler_threads must be >= 2");
  return {};
}

auto load_config_from_env(EngineConfig base) -> std::expected<EngineConfig, core::error> {
  EngineConfig cfg = std::move(base);
  auto& m = cfg.model;
  auto& t = cfg.training;

  auto& ug = cfg.user_index.graph;
  auto& ig = cfg.item_index.graph;

  const std::expected<void, core::error> steps[] = {
      overlay_number("KESTREL_EMBEDDING_DIM", m.embedding_dim),
      overlay_number("KESTREL_LEARNING_RATE", m.learning_rate),
      overlay_number("KESTREL_REGULARIZATION", m.regularization),
      overlay_enum("KESTREL_INIT_METHOD", m.init.method, train::parse_init_method),
      overlay_number("KESTREL_INIT_SEED", m.init_seed),
      overlay_number("KESTREL_BATCH_SIZE", t.batch_size),
      overlay_duration<std::chrono::milliseconds>("KESTREL_BATCH_TIMEOUT_MS", t.batch_timeout),
      overlay_duration<std::chrono::seconds>("KESTREL_MODEL_SAVE_INTERVAL_S",
                                             t.model_save_interval),
      overlay_number("KESTREL_NEGATIVE_SAMPLING_RATIO", t.negative_sampling_ratio),
      overlay_number("KESTREL_CHANNEL_CAPACITY", t.channel_capacity),
      overlay_enum("KESTREL_PROPAGATION", t.propagation, parse_propagation),
      overlay_number("KESTREL_GRAPH_M", ug.M),
      overlay_number("KESTREL_GRAPH_M", ig.M),
      overlay_number("KESTREL_GRAPH_EF_CONSTRUCTION", ug.ef_construction),
      overlay_number("KESTREL_GRAPH_EF_CONSTRUCTION", ig.ef_construction),
      overlay_number("KESTREL_GRAPH_EF_SEARCH", ug.ef_search),
      overlay_number("KESTREL_GRAPH_EF_SEARCH", ig.ef_search),
      overlay_bool("KESTREL_GRAPH_LINK", ug.link_neighbors),
      overlay_bool("KESTREL_GRAPH_LINK", ig.link_neighbors),
      overlay_number("KESTREL_CHECKPOINT_KEEP", cfg.checkpoint_keep),
      overlay_number("KESTREL_SCHEDULER_THREADS", cfg.scheduler_threads),
  };
  for (const auto& step : steps) {
    if (!step) return std::unexpected(step.error());
  }

  if (auto raw = env_value("KESTREL_INDEX_KIND")) {
    auto parsed = index::parse_index_kind(*raw);
    if (!parsed) return invalid("KESTREL_INDEX_KIND: " + parsed.error().message);
    cfg.user_index.kind = *parsed;
    cfg.item_index.kind = *parsed;
  }

  if (auto dir = env_value("KESTREL_CHECKPOINT_DIR")) cfg.checkpoint_dir = *dir;
  if (core::env_flag("KESTREL_TRAINER_DEBUG")) t.verbose = true;

  if (auto ok = validate_config(cfg); !ok) return std::unexpected(ok.error());
  return cfg;
}

} // namespace kestrel
