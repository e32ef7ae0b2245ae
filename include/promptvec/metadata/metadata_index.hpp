#pragma once

/** \file metadata_index.hpp
 *  \brief Roaring bitmaps over document slots for categorical filtering.
 *
 * One bitmap per domain, per document type and per tag, plus the set of all live
 * slots. Filters compile to (OR of domains) AND (OR of types) AND (OR of tags);
 * iteration order is ascending slot, i.e. insertion order.
 *
 * Thread-safety: NOT thread-safe; guarded by the owning store's lock.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <roaring/roaring.hh>

#include "promptvec/document.hpp"
#include "promptvec/filter.hpp"

namespace promptvec::metadata {

class MetadataIndex {
public:
    /** \brief Index a slot's metadata. */
    auto add(std::uint32_t slot, const DocumentMetadata& meta) -> void;

    /** \brief Drop a slot using the metadata it was indexed with. */
    auto remove(std::uint32_t slot, const DocumentMetadata& meta) -> void;

    /** \brief Slots satisfying the categorical part of filters (all live slots when none). */
    [[nodiscard]] auto evaluate(const SearchFilters& filters) const -> roaring::Roaring;

    /** \brief Slots in a domain and/or of a type; nullptr/nullopt means unconstrained. */
    [[nodiscard]] auto select(const std::string* domain, const DocumentType* type) const
        -> roaring::Roaring;

    [[nodiscard]] auto all() const noexcept -> const roaring::Roaring& { return all_; }
    [[nodiscard]] auto domains() const -> std::vector<std::string>;
    [[nodiscard]] auto memory_bytes() const -> std::size_t;

    auto clear() -> void;

private:
    static auto union_of(const std::map<std::string, roaring::Roaring>& index,
                         const std::vector<std::string>& keys) -> roaring::Roaring;

    roaring::Roaring all_;
    std::map<std::string, roaring::Roaring> by_domain_;
    std::map<std::string, roaring::Roaring> by_tag_;
    std::map<DocumentType, roaring::Roaring> by_type_;
};

} // namespace promptvec::metadata
