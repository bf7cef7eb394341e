#pragma once

/** \file index_factory.hpp
 *  \brief Index selection: builds a Linear or Graph index from configuration.
 */

#include <cstddef>
#include <expected>
#include <memory>

#include "kestrel/error.hpp"
#include "kestrel/index/graph_index.hpp"
#include "kestrel/index/vector_index.hpp"

namespace kestrel::index {

/** \brief Index build configuration. */
struct IndexConfig {
    IndexKind kind{IndexKind::linear};   /**< Exact scan or hierarchical graph */
    GraphIndexParams graph;              /**< Used when kind == graph */
};

/** \brief Create an empty index of dimension `dim` as described by `cfg`. */
auto make_vector_index(std::size_t dim, const IndexConfig& cfg)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error>;

} // namespace kestrel::index
