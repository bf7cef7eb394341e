/**
 * Basic kestrel example
 *
 * This example demonstrates:
 * - Opening an engine with a graph item index
 * - Registering item vectors
 * - Training on a handful of interactions
 * - Recommending items for a user while excluding ones already seen
 */

#include <kestrel/engine.hpp>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

// Unit-length random vector for demonstration
std::vector<float> random_unit_vector(std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    std::vector<float> vec(dim);
    float norm = 0.0f;
    for (auto& v : vec) {
        v = dist(gen);
        norm += v * v;
    }
    norm = std::sqrt(norm);
    for (auto& v : vec) {
        v /= norm;
    }
    return vec;
}

int main() {
    using namespace kestrel;

    EngineConfig cfg;
    cfg.model.embedding_dim = 16;
    cfg.model.learning_rate = 0.05f;
    cfg.item_index.kind = index::IndexKind::graph;
    cfg.training.negative_sampling_ratio = 1.0f;

    auto eng = engine::open(cfg);
    if (!eng) {
        std::cerr << "Failed to open engine: " << eng.error().message << std::endl;
        return 1;
    }

    // Register a small catalogue
    for (entity_id item = 1; item <= 50; ++item) {
        ItemFeature feature;
        feature.item_id = item;
        feature.embedding = random_unit_vector(cfg.model.embedding_dim, static_cast<std::uint32_t>(item));
        feature.category = item % 2 ? "books" : "music";
        feature.popularity_score = 0.5f;
        if (auto r = eng->upsert_item_feature(feature); !r) {
            std::cerr << "Upsert failed: " << r.error().message << std::endl;
            return 1;
        }
    }

    // User 7 liked items 3 and 4
    std::vector<TrainingExample> batch;
    for (entity_id item : {3u, 4u}) {
        TrainingExample ex;
        ex.user_id = 7;
        ex.item_id = item;
        ex.label = 1.0f;
        ex.user_features = random_unit_vector(cfg.model.embedding_dim, 700);
        ex.item_features = random_unit_vector(cfg.model.embedding_dim, static_cast<std::uint32_t>(item));
        batch.push_back(ex);
    }
    auto report = eng->train(batch);
    if (!report) {
        std::cerr << "Training failed: " << report.error().message << std::endl;
        return 1;
    }
    std::cout << "Trained " << report->trained << " examples (" << report->negatives
              << " negatives)" << std::endl;

    // Recommend, skipping what the user already saw
    filter::IdFilter seen{3, 4};
    auto recs = eng->recommend_for_user(7, 5, &seen);
    if (!recs) {
        std::cerr << "Recommend failed: " << recs.error().message << std::endl;
        return 1;
    }
    std::cout << "Recommendations for user 7:" << std::endl;
    for (const auto& hit : *recs) {
        std::cout << "  item " << hit.id << " distance " << hit.score << std::endl;
    }
    return 0;
}
