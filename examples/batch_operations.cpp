/**
 * Batch operations example for promptvec
 *
 * This example demonstrates:
 * - Chunked batch insertion
 * - Clustering and drift analysis
 * - Deletion followed by optimize()
 */

#include <promptvec/vector_database.hpp>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace promptvec;
using namespace std::chrono;

namespace {

// Documents drawn around a few topic directions, spread over the last 180 days.
std::vector<VectorDocument> generate_corpus(std::size_t n, std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> noise(0.0f, 0.15f);
    std::uniform_int_distribution<int> age_days(0, 180);
    const std::vector<std::string> domains{"sales", "support", "marketing", "legal"};

    std::vector<std::vector<float>> topics;
    for (std::size_t t = 0; t < domains.size(); ++t) {
        std::vector<float> c(dim, 0.0f);
        c[t % dim] = 1.0f;
        topics.push_back(std::move(c));
    }

    std::vector<VectorDocument> docs;
    docs.reserve(n);
    const auto now = Clock::now();
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t t = i % topics.size();
        VectorDocument d;
        d.id = "doc-" + std::to_string(i);
        d.content = domains[t] + " prompt " + std::to_string(i);
        d.vector = topics[t];
        for (auto& x : d.vector) x += noise(gen);
        d.metadata.domain = domains[t];
        d.metadata.tags = {domains[t], (i % 5 == 0) ? "featured" : "standard"};
        d.metadata.effectiveness = static_cast<double>(i % 10) / 10.0;
        d.metadata.created = now - hours(24 * age_days(gen));
        d.metadata.updated = d.metadata.created;
        docs.push_back(std::move(d));
    }
    return docs;
}

} // namespace

int main() {
    DatabaseOptions options;
    options.config.dimension = 32;
    auto created = VectorDatabase::create(options);
    if (!created) {
        std::cerr << "Failed to create database: " << created.error().message << std::endl;
        return 1;
    }
    auto& db = *created;

    const std::size_t total = 2000;
    auto corpus = generate_corpus(total, options.config.dimension, 42);

    const auto start = steady_clock::now();
    auto applied = db->add_documents(std::move(corpus));
    if (!applied) {
        std::cerr << "Batch insert failed: " << applied.error().message << std::endl;
        return 1;
    }
    const auto ms = duration_cast<milliseconds>(steady_clock::now() - start).count();
    std::cout << "Inserted " << *applied << " documents in " << ms << " ms" << std::endl;

    auto clustering = db->cluster_documents(4);
    if (!clustering) {
        std::cerr << "Clustering failed: " << clustering.error().message << std::endl;
        return 1;
    }
    std::cout << "\nClusters (silhouette " << clustering->silhouette << "):" << std::endl;
    for (const auto& c : clustering->clusters) {
        std::cout << "  " << c.name << ": " << c.size << " docs, avg similarity " << c.avg_similarity
                  << ", mean effectiveness " << c.effectiveness.mean;
        if (!c.dominant_tags.empty()) std::cout << ", top tag " << c.dominant_tags.front();
        std::cout << std::endl;
    }

    const auto drift = db->analyze_semantic_drift();
    std::cout << "\nDrift: overall " << drift.overall_drift << " (recent " << drift.recent_count
              << ", older " << drift.older_count << ")" << std::endl;
    for (const auto& r : drift.recommendations) std::cout << "  - " << r << std::endl;

    std::size_t deleted = 0;
    for (std::size_t i = 0; i < total; i += 3) {
        if (db->delete_document("doc-" + std::to_string(i))) ++deleted;
    }
    std::cout << "\nDeleted " << deleted << " documents" << std::endl;

    const auto report = db->optimize();
    std::cout << "Optimize:" << std::endl;
    for (const auto& step : report.steps) {
        std::cout << "  " << step.name << ": " << step.detail << std::endl;
    }
    std::cout << "Remaining: " << report.after_stats.total_documents << " documents, "
              << report.after_stats.memory_usage.total_mb << " MB" << std::endl;
    return report.all_succeeded() ? 0 : 1;
}
