#pragma once

/** \file search_engine.hpp
 *  \brief Query normalization, candidate retrieval, filtering, ranking and result caching.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "promptvec/cache/lru_cache.hpp"
#include "promptvec/config.hpp"
#include "promptvec/document.hpp"
#include "promptvec/embedding/embedding_provider.hpp"
#include "promptvec/error.hpp"
#include "promptvec/filter.hpp"
#include "promptvec/store/document_store.hpp"

namespace promptvec::search {

/** \brief A similarity query; at least one of vector/text must be present. */
struct SearchQuery {
    std::optional<std::vector<float>> vector;
    std::optional<std::string> text;
    SearchFilters filters;
    std::optional<std::uint32_t> limit;      /**< default DatabaseConfig::default_limit */
    std::optional<float> threshold;          /**< default DatabaseConfig::default_threshold */
};

/** \brief One ranked hit. Ranks are 1..N in descending similarity order. */
struct SearchResult {
    VectorDocument document;
    float similarity{0.0f};
    std::uint32_t rank{0};
};

using SearchResultCache = cache::LruCache<std::string, std::vector<SearchResult>>;

class SearchEngine {
public:
    explicit SearchEngine(const DatabaseConfig& cfg);

    /** \brief Canonical cache key over (vector prefix, text, filters, limit, threshold). */
    [[nodiscard]] auto cache_key(const SearchQuery& query) const -> std::string;

    /** \brief Validate the query and produce its unit-length query vector.
     *
     * A supplied vector wins over text; text goes through the embedder.
     * Errors: invalid_argument (no input, wrong length, limit 0), internal (embedder failure)
     */
    [[nodiscard]] auto resolve(const SearchQuery& query, embedding::EmbeddingProvider& embedder) const
        -> std::expected<std::vector<float>, core::error>;

    [[nodiscard]] auto cached(const std::string& key) -> std::optional<std::vector<SearchResult>>;

    /** \brief Retrieve, filter, rank and cache results for a resolved query vector.
     *
     * Uses the hierarchical index when it has an entry point and a brute-force scan
     * otherwise. An empty corpus yields an empty list.
     */
    auto execute(const store::DocumentStore& store, const SearchQuery& query,
                 std::span<const float> query_vector, const std::string& key)
        -> std::vector<SearchResult>;

    auto invalidate() -> void { cache_.clear(); }
    [[nodiscard]] auto cache_stats() const -> cache::CacheStats { return cache_.stats(); }

    [[nodiscard]] auto effective_limit(const SearchQuery& query) const noexcept -> std::uint32_t {
        return query.limit.value_or(default_limit_);
    }
    [[nodiscard]] auto effective_threshold(const SearchQuery& query) const noexcept -> float {
        return query.threshold.value_or(default_threshold_);
    }

private:
    std::size_t dimension_;
    std::uint32_t default_limit_;
    float default_threshold_;
    std::size_t key_prefix_;
    SearchResultCache cache_;
};

} // namespace promptvec::search
