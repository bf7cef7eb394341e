/** \file id_filter.hpp
 *  \brief Exclusion set of entity ids backed by a 64-bit CRoaring bitmap.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>

#include "roaring64map.hh"

#include "kestrel/types.hpp"

namespace kestrel::filter {

/**
 * \brief Ids that must not appear in search results.
 *
 * Searches consult allows() per candidate; an empty filter allows everything.
 * Not synchronized: build it on the calling thread, then pass it by const
 * reference into concurrent searches.
 */
class IdFilter {
public:
    IdFilter() = default;
    IdFilter(std::initializer_list<entity_id> ids) {
        for (auto id : ids) excluded_.add(id);
    }

    void exclude(entity_id id) { excluded_.add(id); }

    void exclude_many(std::span<const entity_id> ids) {
        excluded_.addMany(ids.size(), ids.data());
    }

    void include(entity_id id) { excluded_.remove(id); }

    [[nodiscard]] bool allows(entity_id id) const { return !excluded_.contains(id); }

    [[nodiscard]] std::uint64_t excluded_count() const { return excluded_.cardinality(); }

    [[nodiscard]] bool empty() const { return excluded_.isEmpty(); }

    /** \brief Union with another exclusion set in place. */
    IdFilter& operator|=(const IdFilter& other) {
        excluded_ |= other.excluded_;
        return *this;
    }

    [[nodiscard]] const roaring::Roaring64Map& bitmap() const noexcept { return excluded_; }

private:
    roaring::Roaring64Map excluded_;
};

} // namespace kestrel::filter
