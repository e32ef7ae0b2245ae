#pragma once

/** \file filter.hpp
 *  \brief Metadata filters for search and their in-memory evaluation.
 *
 * All present constraints are ANDed. An empty set (domains, types, tags) places no
 * constraint. Tags match when the document carries ANY of the listed tags. A
 * missing effectiveness value compares as 0. Date bounds are inclusive.
 */

#include <optional>
#include <string>
#include <vector>

#include "promptvec/document.hpp"

namespace promptvec {

struct SearchFilters {
    std::vector<std::string> domains;       /**< exact match, any of */
    std::vector<DocumentType> types;        /**< exact match, any of */
    std::vector<std::string> tags;          /**< document has any of */
    std::optional<double> effectiveness_min;
    std::optional<Timestamp> created_after;
    std::optional<Timestamp> created_before;

    [[nodiscard]] auto has_categorical() const noexcept -> bool {
        return !domains.empty() || !types.empty() || !tags.empty();
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return !has_categorical() && !effectiveness_min && !created_after && !created_before;
    }

    auto operator==(const SearchFilters&) const -> bool = default;
};

namespace filter_eval {

// Numeric/date constraints; the categorical ones are answered by MetadataIndex bitmaps.
auto matches_ranges(const SearchFilters& filters, const DocumentMetadata& meta) -> bool;

} // namespace filter_eval

} // namespace promptvec
