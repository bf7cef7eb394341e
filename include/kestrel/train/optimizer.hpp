#pragma once

/** \file optimizer.hpp
 *  \brief Parameter optimizers with per-group accumulator state.
 *
 * Every optimizer consumes (parameters, gradients) pairs and moves the
 * parameters against the supplied gradient (descent):
 *   SGD      p -= lr * g
 *   Adam     m = b1*m + (1-b1)*g, v = b2*v + (1-b2)*g^2, t += 1,
 *            p -= lr * m_hat / (sqrt(v_hat) + eps)
 *   AdaGrad  acc += g^2, p -= lr * g / sqrt(acc + eps)
 *   RMSProp  c = rho*c + (1-rho)*g^2, p -= lr * g / sqrt(c + eps)
 *
 * Accumulators are keyed by a parameter-group name so that independent
 * tensors (user table, item table) never share state. Adam keeps a single
 * step counter that advances on every apply() call regardless of group.
 *
 * Thread-safety: none. Callers serialize access (the model holds its
 * exclusive lock while training).
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kestrel/error.hpp"

namespace kestrel::train {

inline constexpr std::string_view kDefaultGroup = "default";

/** \brief Abstract optimizer capability. */
class Optimizer {
public:
  virtual ~Optimizer() = default;

  /** \brief Update `params` in place using the default parameter group.
   *  \throws std::invalid_argument when params.size() != grads.size()
   */
  auto apply(std::span<float> params, std::span<const float> grads) -> void {
    apply(kDefaultGroup, params, grads);
  }

  /** \brief Update `params` in place using the accumulators of `group`.
   *  \throws std::invalid_argument when params.size() != grads.size()
   */
  virtual auto apply(std::string_view group, std::span<float> params,
                     std::span<const float> grads) -> void = 0;

  /** \brief Clear all accumulators and counters. */
  virtual auto reset() -> void = 0;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
  [[nodiscard]] virtual auto learning_rate() const noexcept -> float = 0;
};

class SgdOptimizer final : public Optimizer {
public:
  explicit SgdOptimizer(float learning_rate = 0.01f) : lr_(learning_rate) {}

  using Optimizer::apply;
  auto apply(std::string_view group, std::span<float> params,
             std::span<const float> grads) -> void override;
  auto reset() -> void override {}
  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "sgd"; }
  [[nodiscard]] auto learning_rate() const noexcept -> float override { return lr_; }

private:
  float lr_;
};

/** \brief First and second moment estimates for one group. */
struct AdamMoments {
  std::vector<float> m;
  std::vector<float> v;
};

class AdamOptimizer final : public Optimizer {
public:
  explicit AdamOptimizer(float learning_rate = 0.001f, float beta1 = 0.9f,
                         float beta2 = 0.999f, float epsilon = 1e-8f)
      : lr_(learning_rate), beta1_(beta1), beta2_(beta2), eps_(epsilon) {}

  using Optimizer::apply;
  auto apply(std::string_view group, std::span<float> params,
             std::span<const float> grads) -> void override;
  auto reset() -> void override;
  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "adam"; }
  [[nodiscard]] auto learning_rate() const noexcept -> float override { return lr_; }

  [[nodiscard]] auto step() const noexcept -> std::uint64_t { return t_; }
  [[nodiscard]] auto group_count() const noexcept -> std::size_t { return moments_.size(); }

private:
  float lr_;
  float beta1_;
  float beta2_;
  float eps_;
  std::uint64_t t_{0};
  std::map<std::string, AdamMoments, std::less<>> moments_;
};

/** \brief Running sum of squared gradients for one group. */
struct SquaredGradientSum {
  std::vector<float> sum;
};

class AdaGradOptimizer final : public Optimizer {
public:
  explicit AdaGradOptimizer(float learning_rate = 0.01f, float epsilon = 1e-8f)
      : lr_(learning_rate), eps_(epsilon) {}

  using Optimizer::apply;
  auto apply(std::string_view group, std::span<float> params,
             std::span<const float> grads) -> void override;
  auto reset() -> void override { accumulators_.clear(); }
  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "adagrad"; }
  [[nodiscard]] auto learning_rate() const noexcept -> float override { return lr_; }

private:
  float lr_;
  float eps_;
  std::map<std::string, SquaredGradientSum, std::less<>> accumulators_;
};

/** \brief Exponentially decayed mean of squared gradients for one group. */
struct DecayedSquareCache {
  std::vector<float> cache;
};

class RmsPropOptimizer final : public Optimizer {
public:
  explicit RmsPropOptimizer(float learning_rate = 0.001f, float decay_rate = 0.9f,
                            float epsilon = 1e-8f)
      : lr_(learning_rate), rho_(decay_rate), eps_(epsilon) {}

  using Optimizer::apply;
  auto apply(std::string_view group, std::span<float> params,
             std::span<const float> grads) -> void override;
  auto reset() -> void override { caches_.clear(); }
  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "rmsprop"; }
  [[nodiscard]] auto learning_rate() const noexcept -> float override { return lr_; }

private:
  float lr_;
  float rho_;
  float eps_;
  std::map<std::string, DecayedSquareCache, std::less<>> caches_;
};

enum class OptimizerKind : std::uint8_t { sgd, adam, adagrad, rmsprop };

/** \brief Hyper-parameters for make_optimizer(). Unused fields are ignored per kind. */
struct OptimizerConfig {
  OptimizerKind kind{OptimizerKind::sgd};
  float learning_rate{0.01f};
  float beta1{0.9f};
  float beta2{0.999f};
  float decay_rate{0.9f};
  float epsilon{1e-8f};

  /** \brief Defaults used by the reference deployment for each kind. */
  static auto defaults_for(OptimizerKind kind) -> OptimizerConfig;
};

/** \brief Validate hyper-parameters and build an optimizer. */
auto make_optimizer(const OptimizerConfig& cfg)
    -> std::expected<std::unique_ptr<Optimizer>, core::error>;

auto parse_optimizer_kind(std::string_view text)
    -> std::expected<OptimizerKind, core::error>;

} // namespace kestrel::train
