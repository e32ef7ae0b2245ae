#pragma once

/** \file document.hpp
 *  \brief Vector documents: embedded prompts, templates, examples and feedback.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace promptvec {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/** \brief Kind of content a document carries. */
enum class DocumentType : std::uint8_t {
    Prompt,
    Template,
    Example,
    Feedback,
};

auto to_string(DocumentType type) noexcept -> std::string_view;

/** \brief Open extension field value. */
using MetadataValue = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Document metadata. */
struct DocumentMetadata {
    std::string domain;                                   /**< Owning domain, exact-match filterable */
    DocumentType type{DocumentType::Prompt};
    Timestamp created{};
    Timestamp updated{};
    std::set<std::string> tags;                           /**< Deduplicated, ordered */
    std::optional<double> effectiveness;                  /**< In [0, 1] when present */
    std::optional<std::uint64_t> usage_count;
    std::map<std::string, MetadataValue> extra;           /**< Open extension fields */

    auto operator==(const DocumentMetadata&) const -> bool = default;
};

/** \brief A document and its embedding.
 *
 * The stored vector always has the configured dimensionality and is unit length,
 * except an all-zero input which is stored as given.
 */
struct VectorDocument {
    std::string id;
    std::string content;
    std::vector<float> vector;
    DocumentMetadata metadata;

    auto operator==(const VectorDocument&) const -> bool = default;
};

} // namespace promptvec
