#include "kestrel/train/optimizer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace kestrel::train {

namespace {

auto require_same_length(std::span<float> params, std::span<const float> grads,
                         std::string_view who) -> void {
  if (params.size() != grads.size()) {
    throw std::invalid_argument(std::string(who) + ": parameter/gradient length mismatch (" +
                                std::to_string(params.size()) + " vs " +
                                std::to_string(grads.size()) + ")");
  }
}

// Finds or creates the accumulator of `group`, re-zeroing it when the
// parameter length changed since the last call.
template <typename State, typename Resize>
auto state_for(std::map<std::string, State, std::less<>>& states, std::string_view group,
               std::size_t n, Resize&& resize) -> State& {
  auto it = states.find(group);
  if (it == states.end()) {
    it = states.emplace(std::string(group), State{}).first;
  }
  resize(it->second, n);
  return it->second;
}

auto fit(std::vector<float>& v, std::size_t n) -> void {
  if (v.size() != n) v.assign(n, 0.0f);
}

} // namespace

auto SgdOptimizer::apply(std::string_view, std::span<float> params,
                         std::span<const float> grads) -> void {
  require_same_length(params, grads, "sgd");
  for (std::size_t i = 0; i < params.size(); ++i) {
    params[i] -= lr_ * grads[i];
  }
}

auto AdamOptimizer::apply(std::string_view group, std::span<float> params,
                          std::span<const float> grads) -> void {
  require_same_length(params, grads, "adam");
  auto& st = state_for(moments_, group, params.size(), [](AdamMoments& s, std::size_t n) {
    fit(s.m, n);
    fit(s.v, n);
  });

  ++t_;
  const double bc1 = 1.0 - std::pow(static_cast<double>(beta1_), static_cast<double>(t_));
  const double bc2 = 1.0 - std::pow(static_cast<double>(beta2_), static_cast<double>(t_));

  for (std::size_t i = 0; i < params.size(); ++i) {
    const float g = grads[i];
    st.m[i] = beta1_ * st.m[i] + (1.0f - beta1_) * g;
    st.v[i] = beta2_ * st.v[i] + (1.0f - beta2_) * g * g;
    const float m_hat = static_cast<float>(st.m[i] / bc1);
    const float v_hat = static_cast<float>(st.v[i] / bc2);
    params[i] -= lr_ * m_hat / (std::sqrt(v_hat) + eps_);
  }
}

auto AdamOptimizer::reset() -> void {
  moments_.clear();
  t_ = 0;
}

auto AdaGradOptimizer::apply(std::string_view group, std::span<float> params,
                             std::span<const float> grads) -> void {
  require_same_length(params, grads, "adagrad");
  auto& st = state_for(accumulators_, group, params.size(),
                       [](SquaredGradientSum& s, std::size_t n) { fit(s.sum, n); });
  for (std::size_t i = 0; i < params.size(); ++i) {
    const float g = grads[i];
    st.sum[i] += g * g;
    params[i] -= lr_ * g / std::sqrt(st.sum[i] + eps_);
  }
}

auto RmsPropOptimizer::apply(std::string_view group, std::span<float> params,
                             std::span<const float> grads) -> void {
  require_same_length(params, grads, "rmsprop");
  auto& st = state_for(caches_, group, params.size(),
                       [](DecayedSquareCache& s, std::size_t n) { fit(s.cache, n); });
  for (std::size_t i = 0; i < params.size(); ++i) {
    const float g = grads[i];
    st.cache[i] = rho_ * st.cache[i] + (1.0f - rho_) * g * g;
    params[i] -= lr_ * g / std::sqrt(st.cache[i] + eps_);
  }
}

auto OptimizerConfig::defaults_for(OptimizerKind kind) -> OptimizerConfig {
  OptimizerConfig cfg;
  cfg.kind = kind;
  switch (kind) {
    case OptimizerKind::sgd: cfg.learning_rate = 0.01f; break;
    case OptimizerKind::adam: cfg.learning_rate = 0.001f; break;
    case OptimizerKind::adagrad: cfg.learning_rate = 0.01f; break;
    case OptimizerKind::rmsprop: cfg.learning_rate = 0.001f; break;
  }
  return cfg;
}

auto make_optimizer(const OptimizerConfig& cfg)
    -> std::expected<std::unique_ptr<Optimizer>, core::error> {
  using core::error_code;
  if (!std::isfinite(cfg.learning_rate) || cfg.learning_rate <= 0.0f) {
    return core::make_error(error_code::config_invalid, "learning_rate must be > 0", "train.optimizer");
  }
  if (!(cfg.epsilon > 0.0f)) {
    return core::make_error(error_code::config_invalid, "epsilon must be > 0", "train.optimizer");
  }
  switch (cfg.kind) {
    case OptimizerKind::sgd:
      return std::make_unique<SgdOptimizer>(cfg.learning_rate);
    case OptimizerKind::adam:
      if (!(cfg.beta1 >= 0.0f && cfg.beta1 < 1.0f) || !(cfg.beta2 >= 0.0f && cfg.beta2 < 1.0f)) {
        return core::make_error(error_code::config_invalid, "adam betas must be in [0,1)", "train.optimizer");
      }
      return std::make_unique<AdamOptimizer>(cfg.learning_rate, cfg.beta1, cfg.beta2, cfg.epsilon);
    case OptimizerKind::adagrad:
      return std::make_unique<AdaGradOptimizer>(cfg.learning_rate, cfg.epsilon);
    case OptimizerKind::rmsprop:
      if (!(cfg.decay_rate >= 0.0f && cfg.decay_rate < 1.0f)) {
        return core::make_error(error_code::config_invalid, "rmsprop decay_rate must be in [0,1)", "train.optimizer");
      }
      return std::make_unique<RmsPropOptimizer>(cfg.learning_rate, cfg.decay_rate, cfg.epsilon);
  }
  return core::make_error(error_code::unsupported, "unknown optimizer kind", "train.optimizer");
}

auto parse_optimizer_kind(std::string_view text)
    -> std::expected<OptimizerKind, core::error> {
  if (text == "sgd") return OptimizerKind::sgd;
  if (text == "adam") return OptimizerKind::adam;
  if (text == "adagrad") return OptimizerKind::adagrad;
  if (text == "rmsprop") return OptimizerKind::rmsprop;
  return core::make_error(core::error_code::config_invalid,
                          "unknown optimizer: " + std::string(text), "train.optimizer");
}

} // namespace kestrel::train
