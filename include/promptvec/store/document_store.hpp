#pragma once

/** \file document_store.hpp
 *  \brief Canonical document set and its fan-out into the vector structures.
 *
 * A single upsert entry point validates and normalizes a document, stores it in
 * the flat arena, links it into the hierarchical index, encodes it with the
 * scalar quantizer and indexes its metadata. Removal cascades into all of them.
 *
 * Thread-safety: NOT thread-safe; VectorDatabase serializes writers against readers.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "promptvec/config.hpp"
#include "promptvec/document.hpp"
#include "promptvec/error.hpp"
#include "promptvec/index/flat_index.hpp"
#include "promptvec/index/hierarchical_index.hpp"
#include "promptvec/index/scalar_quantizer.hpp"
#include "promptvec/metadata/metadata_index.hpp"

namespace promptvec::store {

/** \brief Outcome of garbage_collect(). */
struct CollectionReport {
    std::size_t slots_reclaimed{0};         /**< Tombstoned slots compacted away */
    std::size_t adjacency_refs_removed{0};  /**< Stale neighbor references dropped */
    std::size_t codes_dropped{0};           /**< Quantized entries of removed documents */
};

/** \brief Pagination and equality filters for list(). */
struct ListOptions {
    std::optional<std::string> domain;
    std::optional<DocumentType> type;
    std::optional<std::uint32_t> limit;     /**< Missing or 0: DatabaseConfig::list_default_limit */
    std::uint32_t offset{0};
};

class DocumentStore {
public:
    explicit DocumentStore(const DatabaseConfig& cfg);

    /** \brief Check the vector length and L2-normalize it (all-zero stays all-zero).
     *
     * Pure; safe to call concurrently outside the store's lock.
     * Errors: invalid_argument on dimension mismatch or empty id
     */
    [[nodiscard]] auto prepare(VectorDocument doc) const -> std::expected<VectorDocument, core::error>;

    /** \brief Insert or replace a document. \return its slot */
    auto upsert(VectorDocument doc) -> std::expected<std::uint32_t, core::error>;

    /** \brief upsert() for a document already passed through prepare(). */
    auto upsert_prepared(VectorDocument doc) -> std::expected<std::uint32_t, core::error>;

    /** \brief Replace an existing document. Errors: not_found plus upsert()'s. */
    auto update(VectorDocument doc) -> std::expected<std::uint32_t, core::error>;

    /** \brief Delete and return the removed document. Errors: not_found. */
    auto remove(std::string_view id) -> std::expected<VectorDocument, core::error>;

    [[nodiscard]] auto get(std::string_view id) const -> const VectorDocument*;
    [[nodiscard]] auto document(std::uint32_t slot) const -> const VectorDocument& { return docs_[slot]; }

    /** \brief Documents in insertion order, filtered by domain/type and paged. */
    [[nodiscard]] auto list(const ListOptions& options) const -> std::vector<VectorDocument>;

    /** \brief Recompute quantizer parameters from the live corpus. */
    auto recalibrate() -> bool;

    /** \brief Full hierarchical index rebuild (maintenance only). */
    auto rebuild_index() -> std::expected<void, core::error>;

    /** \brief Compact tombstones and purge every reference to removed documents. */
    auto garbage_collect() -> CollectionReport;

    auto clear() -> void;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return flat_.size(); }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return flat_.dimension(); }
    [[nodiscard]] auto flat() const noexcept -> const index::FlatIndex& { return flat_; }
    [[nodiscard]] auto hierarchy() const noexcept -> const index::HierarchicalIndex& { return graph_; }
    [[nodiscard]] auto quantizer() const noexcept -> const index::ScalarQuantizer& { return quantizer_; }
    [[nodiscard]] auto metadata() const noexcept -> const metadata::MetadataIndex& { return meta_; }

    /** \brief Rough in-memory footprint of document metadata and content. */
    [[nodiscard]] auto metadata_bytes() const -> std::size_t;

private:
    std::uint32_t list_default_limit_;
    index::FlatIndex flat_;
    index::HierarchicalIndex graph_;
    index::ScalarQuantizer quantizer_;
    metadata::MetadataIndex meta_;
    std::vector<VectorDocument> docs_;      // by slot; tombstoned slots keep a cleared entry
};

} // namespace promptvec::store
