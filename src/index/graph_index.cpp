/** \file graph_index.cpp
 *  \brief Hierarchical proximity-graph index implementation.
 */

#include "kestrel/index/graph_index.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <mutex>
#include <queue>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "kestrel/core/platform_utils.hpp"
#include "kestrel/kernels/distance.hpp"

namespace kestrel::index {

using core::error_code;

namespace {

constexpr std::uint32_t kNoEntry = std::numeric_limits<std::uint32_t>::max();

using Candidate = std::pair<float, std::uint32_t>;   // (distance, slot)

} // namespace

/** \brief Graph node. `neighbors[l]` holds slots for every l <= level. */
struct GraphNode {
    entity_id id;
    std::vector<float> data;
    std::uint32_t level;
    std::vector<std::vector<std::uint32_t>> neighbors;
};

class GraphIndex::Impl {
public:
    Impl(std::size_t dim, GraphIndexParams params, UniformSource source)
        : dim_(dim), params_(params), source_(std::move(source)), rng_(params.seed),
          level_counts_(params.max_level + 1, 0) {
        dbg_ = core::env_flag("KESTREL_GRAPH_DEBUG");
    }

    auto add(entity_id id, std::span<const float> vec) -> std::expected<void, core::error>;
    auto remove(entity_id id) -> std::expected<void, core::error>;
    auto search(std::span<const float> query, std::size_t k, const filter::IdFilter* filter) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    auto contains(entity_id id) const -> bool {
        std::shared_lock lock(mutex_);
        return id_to_slot_.contains(id);
    }
    auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return id_to_slot_.size();
    }
    auto stats() const -> GraphIndexStats;
    auto reachable_count_base_layer() const -> std::size_t;
    auto level_of(entity_id id) const -> std::expected<std::uint32_t, core::error>;
    auto neighbors(entity_id id, std::uint32_t level) const
        -> std::expected<std::vector<entity_id>, core::error>;
    auto entry_point() const -> std::optional<entity_id> {
        std::shared_lock lock(mutex_);
        if (entry_ == kNoEntry) return std::nullopt;
        return nodes_[entry_]->id;
    }

    std::size_t dim_;
    GraphIndexParams params_;

private:
    auto sample_level() -> std::uint32_t;
    auto distance(std::span<const float> a, std::uint32_t slot) const -> float {
        return kernels::l2_sq(a, nodes_[slot]->data);
    }
    auto max_links(std::uint32_t level) const -> std::size_t {
        return level == 0 ? 2u * params_.M : params_.M;
    }
    auto search_layer(std::span<const float> query, std::uint32_t entry, std::size_t ef,
                      std::uint32_t layer, const filter::IdFilter* filter) const
        -> std::vector<Candidate>;
    auto select_neighbors(std::vector<Candidate> candidates, std::size_t limit) const
        -> std::vector<std::uint32_t>;
    auto insert_locked(entity_id id, std::span<const float> vec) -> void;
    auto link_locked(std::uint32_t slot, std::uint32_t level) -> void;
    auto remove_locked(std::uint32_t slot) -> void;
    auto repair_locked(std::uint32_t slot, std::uint32_t layer,
                       const std::vector<std::uint32_t>& extra) -> void;
    auto elect_entry_locked() -> void;

    UniformSource source_;
    std::mt19937_64 rng_;
    bool dbg_{false};

    mutable std::shared_mutex mutex_;
    std::vector<std::unique_ptr<GraphNode>> nodes_;      // nullptr for freed slots
    std::vector<std::uint32_t> free_slots_;
    std::unordered_map<entity_id, std::uint32_t> id_to_slot_;
    std::vector<std::size_t> level_counts_;
    std::uint32_t entry_{kNoEntry};
    std::uint32_t top_level_{0};
};

auto GraphIndex::Impl::sample_level() -> std::uint32_t {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uint32_t level = 0;
    while (level < params_.max_level) {
        const double u = source_ ? source_() : coin(rng_);
        if (u >= params_.level_probability) break;
        ++level;
    }
    return level;
}

auto GraphIndex::Impl::search_layer(std::span<const float> query, std::uint32_t entry,
                                    std::size_t ef, std::uint32_t layer,
                                    const filter::IdFilter* filter) const
    -> std::vector<Candidate> {
    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }

    auto admits = [&](std::uint32_t slot) {
        return filter == nullptr || filter->allows(nodes_[slot]->id);
    };

    std::priority_queue<Candidate> candidates;   // (-dist, slot): closest on top
    std::priority_queue<Candidate> nearest;      // (dist, slot): farthest on top

    const float entry_dist = distance(query, entry);
    candidates.emplace(-entry_dist, entry);
    if (admits(entry)) nearest.emplace(entry_dist, entry);
    tls.seen[entry] = tls.epoch;

    while (!candidates.empty()) {
        const auto [neg_dist, current] = candidates.top();
        const float current_dist = -neg_dist;
        candidates.pop();

        if (!nearest.empty() && nearest.size() >= ef && current_dist > nearest.top().first) {
            break;
        }

        for (std::uint32_t nb : nodes_[current]->neighbors[layer]) {
            if (tls.seen[nb] == tls.epoch) continue;
            tls.seen[nb] = tls.epoch;

            const float d = distance(query, nb);
            if (nearest.size() < ef || d < nearest.top().first) {
                candidates.emplace(-d, nb);
                if (admits(nb)) {
                    nearest.emplace(d, nb);
                    if (nearest.size() > ef) nearest.pop();
                }
            }
        }
    }

    std::vector<Candidate> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Deterministic ordering on ties (distance, then slot)
    std::sort(result.begin(), result.end());
    return result;
}

// Select-neighbors heuristic: keep a candidate only if it is closer to the
// base node than to every neighbour already kept; then top up with the
// discarded ones, nearest first, until `limit` is reached.
auto GraphIndex::Impl::select_neighbors(std::vector<Candidate> candidates, std::size_t limit) const
    -> std::vector<std::uint32_t> {
    std::sort(candidates.begin(), candidates.end());
    std::vector<std::uint32_t> kept;
    std::vector<std::uint32_t> discarded;
    kept.reserve(limit);

    for (const auto& [dist_c, c] : candidates) {
        if (kept.size() >= limit) break;
        bool diverse = true;
        for (std::uint32_t r : kept) {
            if (kernels::l2_sq(nodes_[c]->data, nodes_[r]->data) < dist_c) {
                diverse = false;
                break;
            }
        }
        if (diverse) {
            kept.push_back(c);
        } else {
            discarded.push_back(c);
        }
    }
    for (std::size_t i = 0; i < discarded.size() && kept.size() < limit; ++i) {
        kept.push_back(discarded[i]);
    }
    return kept;
}

auto GraphIndex::Impl::link_locked(std::uint32_t slot, std::uint32_t level) -> void {
    std::span<const float> vec = nodes_[slot]->data;
    std::uint32_t curr = entry_;

    for (std::uint32_t lc = top_level_; lc > level; --lc) {
        auto nearest = search_layer(vec, curr, 1, lc, nullptr);
        if (!nearest.empty()) curr = nearest.front().second;
    }

    for (std::int64_t lc = std::min(level, top_level_); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto found = search_layer(vec, curr, std::max<std::size_t>(params_.ef_construction, 1),
                                  layer, nullptr);
        if (found.empty()) continue;
        curr = found.front().second;

        const std::size_t cap = max_links(layer);
        auto selected = select_neighbors(found, cap);
        nodes_[slot]->neighbors[layer] = selected;

        // Reverse edges with back-pruning when a neighbour overflows its cap
        for (std::uint32_t nb : selected) {
            auto& links = nodes_[nb]->neighbors[layer];
            links.push_back(slot);
            if (links.size() <= cap) continue;
            std::vector<Candidate> cand;
            cand.reserve(links.size());
            for (std::uint32_t other : links) {
                cand.emplace_back(kernels::l2_sq(nodes_[nb]->data, nodes_[other]->data), other);
            }
            links = select_neighbors(std::move(cand), cap);
        }
    }
}

auto GraphIndex::Impl::insert_locked(entity_id id, std::span<const float> vec) -> void {
    const std::uint32_t level = sample_level();

    std::uint32_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = static_cast<std::uint32_t>(nodes_.size());
        nodes_.emplace_back();
    }
    auto node = std::make_unique<GraphNode>();
    node->id = id;
    node->data.assign(vec.begin(), vec.end());
    node->level = level;
    node->neighbors.resize(level + 1);
    nodes_[slot] = std::move(node);
    id_to_slot_[id] = slot;
    ++level_counts_[level];

    if (entry_ == kNoEntry) {
        entry_ = slot;
        top_level_ = level;
        return;
    }
    if (params_.link_neighbors) {
        link_locked(slot, level);
    }
    if (level > top_level_) {
        entry_ = slot;
        top_level_ = level;
    }
}

auto GraphIndex::Impl::repair_locked(std::uint32_t slot, std::uint32_t layer,
                                     const std::vector<std::uint32_t>& extra) -> void {
    auto& links = nodes_[slot]->neighbors[layer];
    std::vector<Candidate> cand;
    cand.reserve(links.size() + extra.size());
    for (std::uint32_t other : links) {
        cand.emplace_back(kernels::l2_sq(nodes_[slot]->data, nodes_[other]->data), other);
    }
    for (std::uint32_t other : extra) {
        if (other == slot) continue;
        if (std::find(links.begin(), links.end(), other) != links.end()) continue;
        cand.emplace_back(kernels::l2_sq(nodes_[slot]->data, nodes_[other]->data), other);
    }
    links = select_neighbors(std::move(cand), max_links(layer));
}

auto GraphIndex::Impl::remove_locked(std::uint32_t slot) -> void {
    auto removed = std::move(nodes_[slot]);
    id_to_slot_.erase(removed->id);
    --level_counts_[removed->level];
    free_slots_.push_back(slot);

    // Strip every edge into the removed node, then reconnect the affected
    // nodes through the removed node's former neighbours.
    for (std::uint32_t layer = 0; layer <= removed->level; ++layer) {
        const auto& former = removed->neighbors[layer];
        for (std::uint32_t s = 0; s < nodes_.size(); ++s) {
            auto* n = nodes_[s].get();
            if (n == nullptr || n->level < layer) continue;
            auto& links = n->neighbors[layer];
            auto it = std::find(links.begin(), links.end(), slot);
            if (it == links.end()) continue;
            links.erase(it);
            repair_locked(s, layer, former);
        }
    }

    if (entry_ == slot) elect_entry_locked();
}

auto GraphIndex::Impl::elect_entry_locked() -> void {
    entry_ = kNoEntry;
    top_level_ = 0;
    for (std::uint32_t s = 0; s < nodes_.size(); ++s) {
        const auto* n = nodes_[s].get();
        if (n == nullptr) continue;
        if (entry_ == kNoEntry || n->level > top_level_) {
            entry_ = s;
            top_level_ = n->level;
        }
    }
    if (dbg_) {
        std::cerr << "[GRAPH][remove] entry point re-elected: "
                  << (entry_ == kNoEntry ? std::string("none") : std::to_string(nodes_[entry_]->id))
                  << " level=" << top_level_ << std::endl;
    }
}

auto GraphIndex::Impl::add(entity_id id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    if (vec.size() != dim_) {
        return core::make_error(error_code::invalid_argument,
                                "add: dimension mismatch, expected " + std::to_string(dim_) +
                                    " got " + std::to_string(vec.size()),
                                "index.graph");
    }
    std::unique_lock lock(mutex_);
    if (auto it = id_to_slot_.find(id); it != id_to_slot_.end()) {
        remove_locked(it->second);
    }
    insert_locked(id, vec);
    return {};
}

auto GraphIndex::Impl::remove(entity_id id) -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    auto it = id_to_slot_.find(id);
    if (it == id_to_slot_.end()) return {};
    remove_locked(it->second);
    return {};
}

auto GraphIndex::Impl::search(std::span<const float> query, std::size_t k,
                              const filter::IdFilter* filter) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    if (query.size() != dim_) {
        return core::make_error(error_code::invalid_argument,
                                "search: dimension mismatch, expected " + std::to_string(dim_) +
                                    " got " + std::to_string(query.size()),
                                "index.graph");
    }
    std::vector<SearchHit> hits;
    if (k == 0) return hits;

    std::shared_lock lock(mutex_);
    if (entry_ == kNoEntry) return hits;

    std::uint32_t curr = entry_;
    for (std::uint32_t lc = top_level_; lc > 0; --lc) {
        auto nearest = search_layer(query, curr, 1, lc, nullptr);
        if (!nearest.empty()) curr = nearest.front().second;
    }

    const std::size_t ef = std::max<std::size_t>(k, params_.ef_search);
    auto found = search_layer(query, curr, ef, 0, filter);
    const std::size_t take = std::min(k, found.size());
    hits.reserve(take);
    for (std::size_t i = 0; i < take; ++i) {
        hits.push_back({nodes_[found[i].second]->id, found[i].first});
    }
    return hits;
}

auto GraphIndex::Impl::stats() const -> GraphIndexStats {
    std::shared_lock lock(mutex_);
    GraphIndexStats s;
    s.n_nodes = id_to_slot_.size();
    s.top_level = top_level_;
    s.level_counts = level_counts_;
    std::size_t base_edges = 0;
    for (const auto& n : nodes_) {
        if (!n) continue;
        for (const auto& links : n->neighbors) s.n_edges += links.size();
        base_edges += n->neighbors[0].size();
    }
    if (s.n_nodes > 0) {
        s.avg_degree_base = static_cast<float>(base_edges) / static_cast<float>(s.n_nodes);
    }
    return s;
}

auto GraphIndex::Impl::reachable_count_base_layer() const -> std::size_t {
    std::shared_lock lock(mutex_);
    if (entry_ == kNoEntry) return 0;

    std::vector<char> visited(nodes_.size(), 0);
    std::queue<std::uint32_t> q;
    visited[entry_] = 1;
    q.push(entry_);

    std::size_t count = 0;
    while (!q.empty()) {
        auto current = q.front(); q.pop();
        ++count;
        for (std::uint32_t nb : nodes_[current]->neighbors[0]) {
            if (!visited[nb]) {
                visited[nb] = 1;
                q.push(nb);
            }
        }
    }
    return count;
}

auto GraphIndex::Impl::level_of(entity_id id) const -> std::expected<std::uint32_t, core::error> {
    std::shared_lock lock(mutex_);
    auto it = id_to_slot_.find(id);
    if (it == id_to_slot_.end()) {
        return core::make_error(error_code::not_found, "id not present", "index.graph");
    }
    return nodes_[it->second]->level;
}

auto GraphIndex::Impl::neighbors(entity_id id, std::uint32_t level) const
    -> std::expected<std::vector<entity_id>, core::error> {
    std::shared_lock lock(mutex_);
    auto it = id_to_slot_.find(id);
    if (it == id_to_slot_.end()) {
        return core::make_error(error_code::not_found, "id not present", "index.graph");
    }
    const auto& node = *nodes_[it->second];
    if (level > node.level) {
        return core::make_error(error_code::out_of_range, "level above node level", "index.graph");
    }
    std::vector<entity_id> out;
    out.reserve(node.neighbors[level].size());
    for (std::uint32_t s : node.neighbors[level]) out.push_back(nodes_[s]->id);
    return out;
}

// GraphIndex facade

GraphIndex::GraphIndex(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
GraphIndex::~GraphIndex() = default;

auto GraphIndex::create(std::size_t dimension, GraphIndexParams params, UniformSource source)
    -> std::expected<std::unique_ptr<GraphIndex>, core::error> {
    if (dimension == 0) {
        return core::make_error(error_code::invalid_argument, "dimension must be > 0", "index.graph");
    }
    if (params.M < 2) {
        return core::make_error(error_code::config_invalid, "M must be >= 2", "index.graph");
    }
    if (params.max_level > kMaxGraphLevel) {
        return core::make_error(error_code::config_invalid, "max_level must be <= 16", "index.graph");
    }
    if (!(params.level_probability > 0.0 && params.level_probability < 1.0)) {
        return core::make_error(error_code::config_invalid,
                                "level_probability must be in (0,1)", "index.graph");
    }
    return std::unique_ptr<GraphIndex>(
        new GraphIndex(std::make_unique<Impl>(dimension, params, std::move(source))));
}

auto GraphIndex::add(entity_id id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    return impl_->add(id, vec);
}

auto GraphIndex::update(entity_id id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    return impl_->add(id, vec);
}

auto GraphIndex::remove(entity_id id) -> std::expected<void, core::error> {
    return impl_->remove(id);
}

auto GraphIndex::search_similar(std::span<const float> query, std::size_t k,
                                const filter::IdFilter* filter) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    return impl_->search(query, k, filter);
}

auto GraphIndex::contains(entity_id id) const -> bool { return impl_->contains(id); }
auto GraphIndex::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto GraphIndex::size() const -> std::size_t { return impl_->size(); }
auto GraphIndex::params() const noexcept -> const GraphIndexParams& { return impl_->params_; }
auto GraphIndex::stats() const -> GraphIndexStats { return impl_->stats(); }

auto GraphIndex::reachable_count_base_layer() const -> std::size_t {
    return impl_->reachable_count_base_layer();
}

auto GraphIndex::level_of(entity_id id) const -> std::expected<std::uint32_t, core::error> {
    return impl_->level_of(id);
}

auto GraphIndex::neighbors(entity_id id, std::uint32_t level) const
    -> std::expected<std::vector<entity_id>, core::error> {
    return impl_->neighbors(id, level);
}

auto GraphIndex::entry_point() const -> std::optional<entity_id> { return impl_->entry_point(); }

} // namespace kestrel::index
