/** \file vector_database.cpp
 *  \brief Locking, cache coherence and analytics around the engine components.
 */

#include "promptvec/vector_database.hpp"
#include "promptvec/core/debug.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace promptvec {

namespace {

using Millis = std::chrono::duration<double, std::milli>;

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> double {
    return Millis(std::chrono::steady_clock::now() - start).count();
}

auto join_tags(const std::set<std::string>& tags) -> std::string {
    std::string out;
    for (const auto& tag : tags) {
        if (!out.empty()) out += ',';
        out += tag;
    }
    return out;
}

} // anonymous namespace

auto VectorDatabase::create(DatabaseOptions options)
    -> std::expected<std::unique_ptr<VectorDatabase>, core::error> {
    if (options.env_overrides) {
        apply_env_overrides(options.config);
    }
    if (auto ok = options.config.validate(); !ok) {
        return std::unexpected(ok.error());
    }
    return std::unique_ptr<VectorDatabase>(new VectorDatabase(std::move(options)));
}

VectorDatabase::VectorDatabase(DatabaseOptions options)
    : cfg_(options.config)
    , clock_(options.clock ? std::move(options.clock) : std::function<Timestamp()>([] { return Clock::now(); }))
    , embedder_(options.embedder ? std::move(options.embedder)
                                 : std::make_shared<embedding::HashingEmbedder>(options.config.dimension))
    , store_(cfg_)
    , search_(cfg_)
    , clusters_(cfg_)
    , recommender_(cfg_)
    , drift_(cfg_)
    , optimizer_(cfg_)
    , perf_(cfg_.perf_window)
    , events_(std::move(options.analytics), cfg_.analytics_queue_capacity) {
    if (core::debug_enabled()) {
        std::cerr << "[promptvec][db] created dim=" << cfg_.dimension << " M=" << cfg_.index.M
                  << " ef_search=" << cfg_.index.ef_search << std::endl;
    }
}

VectorDatabase::~VectorDatabase() = default;

auto VectorDatabase::invalidate_caches() -> void {
    search_.invalidate();
    clusters_.invalidate();
}

auto VectorDatabase::emit(std::string event_type, std::string entity_id, std::string entity_type,
                          std::map<std::string, std::string> data) -> void {
    events_.post(analytics::AnalyticsEvent{
        std::move(event_type), std::move(entity_id), std::move(entity_type), std::move(data), now()});
}

auto VectorDatabase::emit_added(const VectorDocument& doc) -> void {
    emit("vector_document_added", doc.id, "vector_document",
         {{"domain", doc.metadata.domain},
          {"type", std::string(to_string(doc.metadata.type))},
          {"dimension", std::to_string(doc.vector.size())},
          {"tags", join_tags(doc.metadata.tags)}});
}

auto VectorDatabase::add_document(VectorDocument doc) -> std::expected<void, core::error> {
    const auto start = std::chrono::steady_clock::now();

    auto prepared = store_.prepare(std::move(doc));
    if (!prepared) return std::unexpected(prepared.error());

    {
        std::unique_lock lock(mutex_);
        auto slot = store_.upsert_prepared(*prepared);
        if (!slot) return std::unexpected(slot.error());
        invalidate_caches();
    }

    emit_added(*prepared);
    perf_.record("add_document", elapsed_ms(start));
    return {};
}

auto VectorDatabase::add_documents(std::vector<VectorDocument> docs)
    -> std::expected<std::size_t, core::error> {
    const std::size_t total = docs.size();
    const std::size_t chunk = cfg_.batch_chunk_size;
    std::size_t applied = 0;

    for (std::size_t begin = 0; begin < total; begin += chunk) {
        const std::size_t end = std::min(total, begin + chunk);
        const auto start = std::chrono::steady_clock::now();

        std::vector<std::expected<VectorDocument, core::error>> prepared(end - begin);
        #pragma omp parallel for
        for (int i = 0; i < static_cast<int>(end - begin); ++i) {
            prepared[i] = store_.prepare(std::move(docs[begin + static_cast<std::size_t>(i)]));
        }
        for (const auto& p : prepared) {
            if (!p) return std::unexpected(p.error());
        }

        {
            std::unique_lock lock(mutex_);
            for (auto& p : prepared) {
                auto slot = store_.upsert_prepared(*p);
                if (!slot) {
                    invalidate_caches();
                    return std::unexpected(slot.error());
                }
                ++applied;
            }
            invalidate_caches();
        }

        const double per_doc = elapsed_ms(start) / static_cast<double>(end - begin);
        for (const auto& p : prepared) {
            emit_added(*p);
            perf_.record("add_document", per_doc);
        }

        if (end < total && cfg_.batch_pause.count() > 0) {
            std::this_thread::sleep_for(cfg_.batch_pause);
        }
    }

    if (total > cfg_.recalibration_batch_threshold) {
        std::unique_lock lock(mutex_);
        store_.recalibrate();
    }

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][db][batch] applied=" << applied << " of " << total << std::endl;
    }
    return applied;
}

auto VectorDatabase::update_document(VectorDocument doc) -> std::expected<void, core::error> {
    const auto start = std::chrono::steady_clock::now();
    std::string id = doc.id;
    {
        std::unique_lock lock(mutex_);
        auto slot = store_.update(std::move(doc));
        if (!slot) return std::unexpected(slot.error());
        invalidate_caches();
    }
    if (const auto stored = get_document(id)) {
        emit_added(*stored);
    }
    perf_.record("add_document", elapsed_ms(start));
    return {};
}

auto VectorDatabase::delete_document(std::string_view id) -> std::expected<void, core::error> {
    {
        std::unique_lock lock(mutex_);
        auto removed = store_.remove(id);
        if (!removed) return std::unexpected(removed.error());
        invalidate_caches();
    }
    emit("vector_document_deleted", std::string(id), "vector_document", {});
    return {};
}

auto VectorDatabase::get_document(std::string_view id) const -> std::optional<VectorDocument> {
    std::shared_lock lock(mutex_);
    if (const auto* doc = store_.get(id)) return *doc;
    return std::nullopt;
}

auto VectorDatabase::list_documents(const store::ListOptions& options) const -> std::vector<VectorDocument> {
    std::shared_lock lock(mutex_);
    return store_.list(options);
}

auto VectorDatabase::search(const search::SearchQuery& query)
    -> std::expected<std::vector<search::SearchResult>, core::error> {
    const auto start = std::chrono::steady_clock::now();

    auto query_vector = search_.resolve(query, *embedder_);
    if (!query_vector) return std::unexpected(query_vector.error());

    const std::string key = search_.cache_key(query);
    std::vector<search::SearchResult> results;
    {
        std::shared_lock lock(mutex_);
        if (auto hit = search_.cached(key)) {
            perf_.record("search", elapsed_ms(start));
            return std::move(*hit);
        }
        results = search_.execute(store_, query, *query_vector, key);
    }

    const double ms = elapsed_ms(start);
    emit("vector_search", "search_query", "search",
         {{"query_type", query.vector ? "vector" : "text"},
          {"results_count", std::to_string(results.size())},
          {"search_time_ms", std::to_string(ms)}});
    perf_.record("search", ms);
    return results;
}

auto VectorDatabase::find_similar_documents(std::string_view reference_id, float threshold,
                                            std::uint32_t limit)
    -> std::expected<std::vector<search::SearchResult>, core::error> {
    search::SearchQuery query;
    {
        std::shared_lock lock(mutex_);
        const auto* reference = store_.get(reference_id);
        if (!reference) {
            return std::unexpected(core::error{
                core::error_code::not_found,
                "Document not found: " + std::string(reference_id),
                "search.similar"
            });
        }
        query.vector = reference->vector;
        query.filters.types = {reference->metadata.type};
    }
    query.threshold = threshold;
    query.limit = limit + 1;

    auto results = search(query);
    if (!results) return results;
    return analysis::RecommendationEngine::finalize(
        std::move(*results), {std::string(reference_id)}, limit);
}

auto VectorDatabase::cluster_documents(std::uint32_t k, analysis::ClusterAlgorithm algorithm)
    -> std::expected<analysis::Clustering, core::error> {
    const auto start = std::chrono::steady_clock::now();
    std::shared_lock lock(mutex_);
    auto result = clusters_.cluster(store_, k, algorithm);
    if (result && core::debug_enabled()) {
        std::cerr << "[promptvec][db] clustering completed in " << elapsed_ms(start) << "ms" << std::endl;
    }
    return result;
}

auto VectorDatabase::get_recommendations(std::string_view user_id,
                                         const std::vector<analysis::Interaction>& history,
                                         std::uint32_t limit)
    -> std::expected<std::vector<search::SearchResult>, core::error> {
    const Timestamp t = now();
    std::optional<std::vector<float>> preference;
    {
        std::shared_lock lock(mutex_);
        preference = recommender_.preference_vector(store_.flat(), history, t);
    }
    if (!preference) {
        if (core::debug_enabled()) {
            std::cerr << "[promptvec][recommend] no usable history for user " << user_id << std::endl;
        }
        return std::vector<search::SearchResult>{};
    }

    const auto recent = recommender_.recent_documents(history, t);
    auto results = search(recommender_.make_query(std::move(*preference), limit, recent.size()));
    if (!results) return results;
    return analysis::RecommendationEngine::finalize(std::move(*results), recent, limit);
}

auto VectorDatabase::analyze_semantic_drift() const -> analysis::DriftReport {
    const Timestamp t = now();
    std::shared_lock lock(mutex_);
    return drift_.analyze(store_, t);
}

auto VectorDatabase::get_statistics() -> maintenance::IndexStatistics {
    maintenance::IndexStatistics stats;
    {
        std::shared_lock lock(mutex_);
        stats.total_documents = store_.size();
        stats.total_vectors = store_.flat().size();
        stats.dimensions = store_.dimension();
        stats.memory_usage = maintenance::memory_usage(store_);
    }

    auto& perf = stats.performance_metrics;
    perf.avg_search_time_ms = perf_.average("search");
    perf.avg_insert_time_ms = perf_.average("add_document");
    perf.cache_hit_rate = search_.cache_stats().hit_rate();
    perf.queries_per_second = perf.avg_search_time_ms > 0.0 ? 1000.0 / perf.avg_search_time_ms : 0.0;

    constexpr std::uint32_t kStatsClusters = 10;
    if (stats.total_documents >= kStatsClusters) {
        auto clustering = cluster_documents(kStatsClusters);
        if (clustering) {
            maintenance::ClusterInfo info;
            info.num_clusters = clustering->clusters.size();
            std::size_t members = 0;
            for (const auto& c : clustering->clusters) members += c.size;
            info.avg_cluster_size = static_cast<double>(members) / static_cast<double>(info.num_clusters);
            info.silhouette_score = clustering->silhouette;
            stats.cluster_info = info;
        } else {
            core::log_warning("stats", "could not calculate cluster info: " + clustering.error().message);
        }
    }
    return stats;
}

auto VectorDatabase::optimize() -> maintenance::OptimizationReport {
    const auto start = std::chrono::steady_clock::now();
    maintenance::OptimizationReport report;
    report.before_stats = get_statistics();
    {
        std::unique_lock lock(mutex_);
        report.steps = optimizer_.run(store_, [this]() -> std::expected<void, core::error> {
            invalidate_caches();
            return {};
        });
    }
    report.after_stats = get_statistics();
    report.performance_improvement = maintenance::improvement_percent(
        report.before_stats.performance_metrics.avg_search_time_ms,
        report.after_stats.performance_metrics.avg_search_time_ms);

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][optimize] completed in " << elapsed_ms(start) << "ms, improvement "
                  << report.performance_improvement << "%" << std::endl;
    }
    return report;
}

auto VectorDatabase::clear_database() -> void {
    std::unique_lock lock(mutex_);
    store_.clear();
    invalidate_caches();
    if (core::debug_enabled()) {
        std::cerr << "[promptvec][db] cleared" << std::endl;
    }
}

auto VectorDatabase::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return store_.size();
}

} // namespace promptvec
