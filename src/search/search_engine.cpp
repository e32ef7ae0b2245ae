/** \file search_engine.cpp
 *  \brief Candidate retrieval and ranking.
 */

#include "promptvec/search/search_engine.hpp"
#include "promptvec/core/debug.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace promptvec::search {

namespace {

auto write_string(std::ostringstream& os, const std::string& s) -> void {
    os << s.size() << ':' << s;
}

auto write_time(std::ostringstream& os, const std::optional<Timestamp>& t) -> void {
    if (t) {
        os << std::chrono::duration_cast<std::chrono::milliseconds>(t->time_since_epoch()).count();
    } else {
        os << '-';
    }
}

} // anonymous namespace

SearchEngine::SearchEngine(const DatabaseConfig& cfg)
    : dimension_(cfg.dimension)
    , default_limit_(cfg.default_limit)
    , default_threshold_(cfg.default_threshold)
    , key_prefix_(cfg.cache_key_prefix)
    , cache_(cfg.search_cache_capacity, cfg.search_cache_ttl) {}

auto SearchEngine::cache_key(const SearchQuery& query) const -> std::string {
    std::ostringstream os;
    os << std::setprecision(9);
    os << "v[";
    if (query.vector) {
        const auto n = std::min(key_prefix_, query.vector->size());
        for (std::size_t i = 0; i < n; ++i) os << (*query.vector)[i] << ',';
    } else {
        os << '-';
    }
    os << "]t[";
    if (query.text) write_string(os, *query.text); else os << '-';

    const auto& f = query.filters;
    os << "]d[";
    for (const auto& d : f.domains) { write_string(os, d); os << ','; }
    os << "]y[";
    for (auto type : f.types) os << static_cast<int>(type) << ',';
    os << "]g[";
    for (const auto& g : f.tags) { write_string(os, g); os << ','; }
    os << "]e[";
    if (f.effectiveness_min) os << *f.effectiveness_min; else os << '-';
    os << "]a[";
    write_time(os, f.created_after);
    os << "]b[";
    write_time(os, f.created_before);
    os << "]l[";
    if (query.limit) os << *query.limit; else os << '-';
    os << "]h[";
    if (query.threshold) os << *query.threshold; else os << '-';
    os << ']';
    return os.str();
}

auto SearchEngine::resolve(const SearchQuery& query, embedding::EmbeddingProvider& embedder) const
    -> std::expected<std::vector<float>, core::error> {
    if (query.limit && *query.limit == 0) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument, "limit must be > 0", "search"});
    }

    std::vector<float> vec;
    if (query.vector) {
        vec = *query.vector;
    } else if (query.text) {
        try {
            auto embedded = embedder.embed(*query.text);
            if (!embedded) {
                return std::unexpected(core::error{
                    core::error_code::internal,
                    "Embedding provider failed: " + embedded.error().message,
                    "search.embed"
                });
            }
            vec = std::move(*embedded);
        } catch (const std::exception& e) {
            return std::unexpected(core::error{
                core::error_code::internal,
                std::string("Embedding provider threw: ") + e.what(),
                "search.embed"
            });
        }
    } else {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Query must include either vector or text",
            "search"
        });
    }

    if (vec.size() != dimension_) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Query dimension mismatch: expected " + std::to_string(dimension_) +
                ", got " + std::to_string(vec.size()),
            "search"
        });
    }
    kernels::normalize_in_place(vec);
    return vec;
}

auto SearchEngine::cached(const std::string& key) -> std::optional<std::vector<SearchResult>> {
    return cache_.get(key);
}

auto SearchEngine::execute(const store::DocumentStore& store, const SearchQuery& query,
                           std::span<const float> query_vector, const std::string& key)
    -> std::vector<SearchResult> {
    const std::uint32_t limit = effective_limit(query);
    const float threshold = effective_threshold(query);

    std::vector<index::ScoredSlot> candidates;
    if (store.size() > 0) {
        auto approx = store.hierarchy().search(store.flat(), query_vector, limit, threshold);
        if (approx) {
            candidates = std::move(*approx);
        } else {
            if (core::debug_enabled()) {
                std::cerr << "[promptvec][search] brute force fallback: " << approx.error().message << std::endl;
            }
            candidates = store.flat().scan(query_vector, threshold);
        }
    }

    const auto& filters = query.filters;
    if (!filters.empty()) {
        std::optional<roaring::Roaring> allowed;
        if (filters.has_categorical()) allowed = store.metadata().evaluate(filters);
        std::erase_if(candidates, [&](const index::ScoredSlot& c) {
            if (allowed && !allowed->contains(c.slot)) return true;
            return !filter_eval::matches_ranges(filters, store.document(c.slot).metadata);
        });
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const index::ScoredSlot& a, const index::ScoredSlot& b) {
                         return a.similarity > b.similarity;
                     });
    if (candidates.size() > limit) candidates.resize(limit);

    std::vector<SearchResult> results;
    results.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        results.push_back(SearchResult{
            store.document(candidates[i].slot),
            candidates[i].similarity,
            static_cast<std::uint32_t>(i + 1)
        });
    }

    cache_.put(key, results);
    return results;
}

} // namespace promptvec::search
