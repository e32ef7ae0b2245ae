#pragma once

/** \file vector_database.hpp
 *  \brief Vector similarity search over prompt-platform documents.
 *
 * VectorDatabase ties the document store, search engine, analyzers, maintenance
 * and analytics together behind one reader/writer lock:
 * - Writes (add, update, delete, optimize, clear) are exclusive and invalidate the
 *   search and cluster caches.
 * - Reads (lookups, search, clustering, recommendations, drift, statistics) share
 *   the lock; caches and latency windows carry their own locks.
 * - Text embedding runs before the lock is taken; analytics are posted to a
 *   bounded asynchronous channel and never fail the calling operation.
 *
 * Example:
 * \code
 * auto db = promptvec::VectorDatabase::create({});
 * if (!db) return;
 * (*db)->add_document(doc);
 * auto hits = (*db)->search({.text = "summarize meeting notes"});
 * \endcode
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "promptvec/analysis/cluster_analyzer.hpp"
#include "promptvec/analysis/drift_analyzer.hpp"
#include "promptvec/analysis/recommendation_engine.hpp"
#include "promptvec/analytics/event_channel.hpp"
#include "promptvec/config.hpp"
#include "promptvec/document.hpp"
#include "promptvec/embedding/embedding_provider.hpp"
#include "promptvec/error.hpp"
#include "promptvec/maintenance/optimizer.hpp"
#include "promptvec/maintenance/performance_tracker.hpp"
#include "promptvec/search/search_engine.hpp"
#include "promptvec/store/document_store.hpp"

namespace promptvec {

/** \brief Construction options; every collaborator has a default. */
struct DatabaseOptions {
    DatabaseConfig config;
    std::function<Timestamp()> clock;                         /**< default Clock::now */
    std::shared_ptr<embedding::EmbeddingProvider> embedder;   /**< default HashingEmbedder */
    std::shared_ptr<analytics::AnalyticsSink> analytics;      /**< default NullAnalyticsSink */
    bool env_overrides{true};                                 /**< overlay PROMPTVEC_* variables onto config */
};

class VectorDatabase {
public:
    /** \brief Apply env overrides, validate and build an empty database. Errors: config_invalid. */
    static auto create(DatabaseOptions options)
        -> std::expected<std::unique_ptr<VectorDatabase>, core::error>;

    ~VectorDatabase();
    VectorDatabase(const VectorDatabase&) = delete;
    VectorDatabase& operator=(const VectorDatabase&) = delete;

    /** \brief Insert or replace a document (upsert). Errors: invalid_argument. */
    auto add_document(VectorDocument doc) -> std::expected<void, core::error>;

    /** \brief Chunked batch insert.
     *
     * Each chunk is validated and normalized in parallel, then applied in input
     * order; later duplicates of an id win. A chunk containing an invalid document
     * is rejected whole and processing stops; earlier chunks stay committed.
     * Batches larger than recalibration_batch_threshold recalibrate the quantizer.
     * \return number of documents applied
     */
    auto add_documents(std::vector<VectorDocument> docs) -> std::expected<std::size_t, core::error>;

    /** \brief Replace an existing document. Errors: not_found, invalid_argument. */
    auto update_document(VectorDocument doc) -> std::expected<void, core::error>;

    /** \brief Remove a document everywhere. Errors: not_found. */
    auto delete_document(std::string_view id) -> std::expected<void, core::error>;

    [[nodiscard]] auto get_document(std::string_view id) const -> std::optional<VectorDocument>;
    [[nodiscard]] auto list_documents(const store::ListOptions& options = {}) const
        -> std::vector<VectorDocument>;

    /** \brief Ranked similarity search. Errors: invalid_argument, internal (embedding). */
    auto search(const search::SearchQuery& query)
        -> std::expected<std::vector<search::SearchResult>, core::error>;

    /** \brief Documents of the same type similar to a stored one, excluding it.
     *
     * Errors: not_found when reference_id is unknown
     */
    auto find_similar_documents(std::string_view reference_id, float threshold = 0.7f,
                                std::uint32_t limit = 10)
        -> std::expected<std::vector<search::SearchResult>, core::error>;

    auto cluster_documents(std::uint32_t k = 10,
                           analysis::ClusterAlgorithm algorithm = analysis::ClusterAlgorithm::KMeans)
        -> std::expected<analysis::Clustering, core::error>;

    /** \brief Recommendations from interaction history; empty when nothing matches. */
    auto get_recommendations(std::string_view user_id,
                             const std::vector<analysis::Interaction>& history,
                             std::uint32_t limit = 10)
        -> std::expected<std::vector<search::SearchResult>, core::error>;

    [[nodiscard]] auto analyze_semantic_drift() const -> analysis::DriftReport;

    auto get_statistics() -> maintenance::IndexStatistics;

    /** \brief Maintenance pass; sub-step failures are reported, not raised. */
    auto optimize() -> maintenance::OptimizationReport;

    /** \brief Drop every document, index level, quantized code and cached result. */
    auto clear_database() -> void;

    /** \brief Wait for queued analytics events to reach the sink. */
    auto flush_analytics() -> void { events_.flush(); }
    [[nodiscard]] auto analytics_stats() const -> analytics::ChannelStats { return events_.stats(); }

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto config() const noexcept -> const DatabaseConfig& { return cfg_; }

private:
    explicit VectorDatabase(DatabaseOptions options);

    auto now() const -> Timestamp { return clock_(); }
    auto invalidate_caches() -> void;
    auto emit(std::string event_type, std::string entity_id, std::string entity_type,
              std::map<std::string, std::string> data) -> void;
    auto emit_added(const VectorDocument& doc) -> void;

    DatabaseConfig cfg_;
    std::function<Timestamp()> clock_;
    std::shared_ptr<embedding::EmbeddingProvider> embedder_;

    mutable std::shared_mutex mutex_;
    store::DocumentStore store_;
    search::SearchEngine search_;
    analysis::ClusterAnalyzer clusters_;
    analysis::RecommendationEngine recommender_;
    analysis::DriftAnalyzer drift_;
    maintenance::Optimizer optimizer_;
    maintenance::PerformanceTracker perf_;
    analytics::EventChannel events_;
};

} // namespace promptvec
