#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "kestrel/config.hpp"
#include "kestrel/core/platform_utils.hpp"
#include "kestrel/engine.hpp"
#include "kestrel/filter/id_filter.hpp"

namespace {

struct Args {
    std::size_t users{200};
    std::size_t items{500};
    std::size_t events{20000};
    std::size_t dim{32};
    std::size_t batch{256};
    std::size_t k{10};
    std::uint64_t seed{7};
    std::string index{"linear"};
    std::string checkpoint_dir;   // empty => in-memory snapshots
    bool streaming{true};
    bool restore{false};
};

std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

void print_usage() {
    std::cout << "kestrel trainer: drives a synthetic interaction stream through the engine\n"
              << "Usage: kestrel_trainer [--users=N] [--items=N] [--events=N] [--dim=D]\n"
              << "  [--batch=N] [--k=N] [--seed=S] [--index=linear|graph]\n"
              << "  [--checkpoint_dir=path] [--sync] [--restore]\n"
              << "KESTREL_* environment variables are applied before flags.\n";
}

template <typename T>
bool parse_into(const std::string& flag, const std::string& text, T& out) {
    auto v = kestrel::core::parse_number<T>(text);
    if (!v) {
        std::cerr << "invalid value for " << flag << ": '" << text << "'\n";
        return false;
    }
    out = *v;
    return true;
}

// Hidden factors the synthetic labels are drawn from.
struct World {
    std::size_t dim;
    std::vector<float> user_factors;
    std::vector<float> item_factors;

    World(std::size_t users, std::size_t items, std::size_t d, std::mt19937_64& rng)
        : dim(d), user_factors(users * d), item_factors(items * d) {
        std::normal_distribution<float> nd(0.0f, 1.0f / std::sqrt(static_cast<float>(d)));
        for (auto& x : user_factors) x = nd(rng);
        for (auto& x : item_factors) x = nd(rng);
    }

    std::vector<float> user(std::size_t u) const {
        return {user_factors.begin() + u * dim, user_factors.begin() + (u + 1) * dim};
    }
    std::vector<float> item(std::size_t i) const {
        return {item_factors.begin() + i * dim, item_factors.begin() + (i + 1) * dim};
    }

    kestrel::TrainingExample draw(std::size_t n_users, std::size_t n_items,
                                  std::mt19937_64& rng) const {
        std::uniform_int_distribution<std::size_t> pick_u(0, n_users - 1);
        std::uniform_int_distribution<std::size_t> pick_i(0, n_items - 1);
        const auto u = pick_u(rng);
        const auto i = pick_i(rng);
        kestrel::TrainingExample ex;
        ex.user_id = u + 1;
        ex.item_id = i + 1;
        ex.user_features = user(u);
        ex.item_features = item(i);
        float dot = 0.0f;
        for (std::size_t d = 0; d < dim; ++d) dot += ex.user_features[d] * ex.item_features[d];
        ex.label = dot > 0.0f ? 1.0f : 0.0f;
        ex.timestamp = std::chrono::system_clock::now();
        return ex;
    }
};

} // namespace

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        bool ok = true;
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--users=")) ok = parse_into("--users", *v, args.users);
        else if (auto v = eat(a, "--items=")) ok = parse_into("--items", *v, args.items);
        else if (auto v = eat(a, "--events=")) ok = parse_into("--events", *v, args.events);
        else if (auto v = eat(a, "--dim=")) ok = parse_into("--dim", *v, args.dim);
        else if (auto v = eat(a, "--batch=")) ok = parse_into("--batch", *v, args.batch);
        else if (auto v = eat(a, "--k=")) ok = parse_into("--k", *v, args.k);
        else if (auto v = eat(a, "--seed=")) ok = parse_into("--seed", *v, args.seed);
        else if (auto v = eat(a, "--index=")) args.index = *v;
        else if (auto v = eat(a, "--checkpoint_dir=")) args.checkpoint_dir = *v;
        else if (a == "--sync") args.streaming = false;
        else if (a == "--restore") args.restore = true;
        else {
            std::cerr << "unknown flag: " << a << "\n";
            print_usage();
            return 2;
        }
        if (!ok) return 2;
    }
    if (args.users == 0 || args.items == 0) {
        std::cerr << "--users and --items must be > 0\n";
        return 2;
    }

    kestrel::EngineConfig base;
    base.model.embedding_dim = args.dim;
    base.model.learning_rate = 0.05f;
    base.training.batch_size = args.batch;
    base.training.batch_timeout = std::chrono::milliseconds(200);
    base.training.propagation = kestrel::service::PropagationSource::embeddings;
    base.checkpoint_dir = args.checkpoint_dir;
    auto kind = kestrel::index::parse_index_kind(args.index);
    if (!kind) {
        std::cerr << kind.error().message << "\n";
        return 2;
    }
    base.user_index.kind = *kind;
    base.item_index.kind = *kind;

    auto cfg = kestrel::load_config_from_env(base);
    if (!cfg) {
        std::cerr << "config: " << cfg.error().message << "\n";
        return 2;
    }
    const std::size_t dim = cfg->model.embedding_dim;

    auto eng = kestrel::engine::open(*cfg);
    if (!eng) {
        std::cerr << "open failed: " << eng.error().message << "\n";
        return 1;
    }

    if (args.restore) {
        if (auto v = eng->restore_latest_checkpoint()) {
            std::cout << "Restored checkpoint " << *v << "\n";
        } else {
            std::cerr << "restore skipped: " << v.error().message << "\n";
        }
    }

    std::mt19937_64 rng(args.seed);
    World world(args.users, args.items, dim, rng);

    // Held-out sample used to report loss before and after.
    std::vector<kestrel::TrainingExample> holdout;
    for (std::size_t i = 0; i < 1000; ++i) holdout.push_back(world.draw(args.users, args.items, rng));

    auto t0 = std::chrono::steady_clock::now();
    if (args.streaming) {
        if (auto r = eng->start(); !r) {
            std::cerr << "start failed: " << r.error().message << "\n";
            return 1;
        }
        for (std::size_t e = 0; e < args.events; ++e) {
            if (auto r = eng->publish(world.draw(args.users, args.items, rng)); !r) {
                std::cerr << "publish failed: " << r.error().message << "\n";
                break;
            }
        }
        eng->stop();
    } else {
        std::vector<kestrel::TrainingExample> batch;
        batch.reserve(args.batch);
        for (std::size_t e = 0; e < args.events; ++e) {
            batch.push_back(world.draw(args.users, args.items, rng));
            if (batch.size() == args.batch || e + 1 == args.events) {
                if (auto r = eng->train(batch); !r) {
                    std::cerr << "train failed: " << r.error().message << "\n";
                }
                batch.clear();
            }
        }
    }
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    auto stats = eng->stats();
    std::cout << std::fixed << std::setprecision(4)
              << "Trained " << stats.trainer.examples_trained << " examples ("
              << stats.trainer.negatives_generated << " negatives) in " << secs << " s over "
              << stats.trainer.flushes << " flushes\n"
              << "Rejected=" << stats.trainer.rejected
              << " FailedFlushes=" << stats.trainer.failed_flushes
              << " PropagationFailures=" << stats.trainer.propagation_failures << "\n"
              << "Users=" << stats.trainer.user_embeddings
              << " Items=" << stats.trainer.item_embeddings
              << " UserIndex=" << stats.user_index_size
              << " ItemIndex=" << stats.item_index_size << "\n"
              << "Holdout MSE=" << eng->model().compute_loss(holdout) << "\n";

    kestrel::filter::IdFilter exclude;
    for (std::size_t u = 1; u <= std::min<std::size_t>(3, args.users); ++u) {
        auto recs = eng->recommend_for_user(u, args.k, &exclude);
        if (!recs) {
            std::cerr << "recommend failed: " << recs.error().message << "\n";
            continue;
        }
        std::cout << "user " << u << ":";
        for (const auto& hit : *recs) std::cout << " " << hit.id << "(" << hit.score << ")";
        std::cout << "\n";
    }

    if (auto r = eng->snapshot_now(); !r) {
        std::cerr << "snapshot failed: " << r.error().message << "\n";
        return 1;
    }
    std::cout << "Snapshot saved"
              << (cfg->checkpoint_dir.empty() ? " (memory)" : " to " + cfg->checkpoint_dir.string())
              << "\n";
    return 0;
}
