#pragma once

/** \file graph_index.hpp
 *  \brief Hierarchical proximity-graph index (HNSW family) under squared L2.
 *
 * Structure:
 * - Each node draws a level by repeated coin flips (P(level >= L) = p^L,
 *   capped at max_level) from a seedable or injected uniform source.
 * - The entry point is a node of the topmost non-empty layer.
 * - Search descends the upper layers greedily with beam width 1, then runs
 *   a best-first beam of width max(k, ef_search) on layer 0.
 *
 * Linking: with link_neighbors = true (default) every insert connects the new
 * node to neighbours found by an ef_construction beam (M per upper layer, 2M
 * on layer 0) with reverse edges and heuristic pruning. With
 * link_neighbors = false nodes only record layer membership and a search
 * returns at most the entry point.
 *
 * Thread-safety: one reader/writer lock per index. Searches share it; add,
 * update and remove take it exclusively.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "kestrel/index/vector_index.hpp"

namespace kestrel::index {

inline constexpr std::uint32_t kMaxGraphLevel = 16;

/** \brief Graph construction and search parameters. */
struct GraphIndexParams {
    std::uint32_t M{16};                    /**< Links per node on upper layers; 2M on layer 0 */
    std::uint32_t ef_construction{200};     /**< Beam width while linking a new node */
    std::uint32_t ef_search{64};            /**< Minimum layer-0 beam width during search */
    std::uint32_t max_level{kMaxGraphLevel};/**< Level cap (<= 16) */
    double level_probability{0.5};          /**< Coin-flip success probability */
    bool link_neighbors{true};              /**< Build adjacency on insert */
    std::uint64_t seed{42};                 /**< Seed for level assignment */
};

/** \brief Graph statistics. */
struct GraphIndexStats {
    std::size_t n_nodes{0};                 /**< Live nodes */
    std::size_t n_edges{0};                 /**< Directed edges over all layers */
    std::uint32_t top_level{0};             /**< Level of the entry point */
    float avg_degree_base{0.0f};            /**< Mean out-degree on layer 0 */
    std::vector<std::size_t> level_counts;  /**< Nodes whose level is exactly L */
};

/** \brief Source of uniform draws in [0,1) used for level assignment. */
using UniformSource = std::function<double()>;

class GraphIndex final : public VectorIndex {
public:
    /** \brief Build an empty index.
     *
     * \param dimension Vector dimensionality (> 0)
     * \param params Construction parameters
     * \param source Optional level source; defaults to mt19937_64(params.seed)
     */
    static auto create(std::size_t dimension, GraphIndexParams params = {},
                       UniformSource source = {})
        -> std::expected<std::unique_ptr<GraphIndex>, core::error>;

    ~GraphIndex() override;
    GraphIndex(const GraphIndex&) = delete;
    GraphIndex& operator=(const GraphIndex&) = delete;

    /** \brief Insert; an existing id is removed first and re-inserted. */
    auto add(entity_id id, std::span<const float> vec)
        -> std::expected<void, core::error> override;
    auto update(entity_id id, std::span<const float> vec)
        -> std::expected<void, core::error> override;
    /** \brief Unlink the node, repair its neighbours and re-elect the entry point. */
    auto remove(entity_id id) -> std::expected<void, core::error> override;
    auto search_similar(std::span<const float> query, std::size_t k,
                        const filter::IdFilter* filter = nullptr) const
        -> std::expected<std::vector<SearchHit>, core::error> override;

    [[nodiscard]] auto contains(entity_id id) const -> bool override;
    [[nodiscard]] auto dimension() const noexcept -> std::size_t override;
    [[nodiscard]] auto size() const -> std::size_t override;
    [[nodiscard]] auto metric() const noexcept -> Metric override { return Metric::l2_squared; }
    [[nodiscard]] auto kind() const noexcept -> IndexKind override { return IndexKind::graph; }

    [[nodiscard]] auto params() const noexcept -> const GraphIndexParams&;
    [[nodiscard]] auto stats() const -> GraphIndexStats;

    /** \brief Number of live nodes reachable from the entry point on layer 0. */
    [[nodiscard]] auto reachable_count_base_layer() const -> std::size_t;

    /** \brief Level drawn for `id`, or not_found. */
    auto level_of(entity_id id) const -> std::expected<std::uint32_t, core::error>;

    /** \brief Adjacency of `id` on `level`, or not_found / out_of_range. */
    auto neighbors(entity_id id, std::uint32_t level) const
        -> std::expected<std::vector<entity_id>, core::error>;

    [[nodiscard]] auto entry_point() const -> std::optional<entity_id>;

private:
    class Impl;
    explicit GraphIndex(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace kestrel::index
