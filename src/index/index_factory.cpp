#include "kestrel/index/index_factory.hpp"

#include <string>

#include "kestrel/index/linear_index.hpp"

namespace kestrel::index {

auto parse_index_kind(std::string_view text) -> std::expected<IndexKind, core::error> {
    if (text == "linear") return IndexKind::linear;
    if (text == "graph" || text == "hnsw") return IndexKind::graph;
    return core::make_error(core::error_code::config_invalid,
                            "unknown index kind: " + std::string(text), "index");
}

auto make_vector_index(std::size_t dim, const IndexConfig& cfg)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    switch (cfg.kind) {
        case IndexKind::linear: {
            auto idx = LinearIndex::create(dim);
            if (!idx) return std::unexpected(idx.error());
            return std::unique_ptr<VectorIndex>(std::move(*idx));
        }
        case IndexKind::graph: {
            auto idx = GraphIndex::create(dim, cfg.graph);
            if (!idx) return std::unexpected(idx.error());
            return std::unique_ptr<VectorIndex>(std::move(*idx));
        }
    }
    return core::make_error(core::error_code::invalid_argument, "unknown index kind", "index");
}

} // namespace kestrel::index
