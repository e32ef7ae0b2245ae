/**
 * Simple similarity search example using promptvec
 *
 * This example demonstrates:
 * - Creating a database with the hashing embedder
 * - Adding prompt documents
 * - Text and vector search with filters
 * - Finding similar documents
 */

#include <promptvec/vector_database.hpp>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

struct Sample {
    const char* id;
    const char* text;
    const char* domain;
    promptvec::DocumentType type;
    std::set<std::string> tags;
};

void print_results(const std::vector<promptvec::search::SearchResult>& results) {
    for (const auto& r : results) {
        std::cout << "  #" << r.rank << " " << r.document.id
                  << " (similarity " << r.similarity << ") "
                  << r.document.content << std::endl;
    }
    if (results.empty()) {
        std::cout << "  (no matches)" << std::endl;
    }
}

} // namespace

int main() {
    using namespace promptvec;

    DatabaseOptions options;
    options.config.dimension = 64;
    auto created = VectorDatabase::create(options);
    if (!created) {
        std::cerr << "Failed to create database: " << created.error().message << std::endl;
        return 1;
    }
    auto& db = *created;

    embedding::HashingEmbedder embedder(options.config.dimension);
    const std::vector<Sample> samples{
        {"p1", "write a cold outreach sales email", "sales", DocumentType::Prompt, {"email", "outreach"}},
        {"p2", "draft a follow up sales email after a demo", "sales", DocumentType::Prompt, {"email"}},
        {"t1", "sales email template with greeting and call to action", "sales", DocumentType::Template, {"email"}},
        {"p3", "summarize customer support ticket history", "support", DocumentType::Prompt, {"summary"}},
        {"p4", "classify support ticket urgency", "support", DocumentType::Prompt, {"triage"}},
    };

    for (const auto& s : samples) {
        auto vec = embedder.embed(s.text);
        if (!vec) {
            std::cerr << "Embedding failed: " << vec.error().message << std::endl;
            return 1;
        }
        VectorDocument doc;
        doc.id = s.id;
        doc.content = s.text;
        doc.vector = std::move(*vec);
        doc.metadata.domain = s.domain;
        doc.metadata.type = s.type;
        doc.metadata.tags = s.tags;
        doc.metadata.created = Clock::now();
        doc.metadata.updated = doc.metadata.created;
        if (auto r = db->add_document(std::move(doc)); !r) {
            std::cerr << "Failed to add " << s.id << ": " << r.error().message << std::endl;
            return 1;
        }
    }
    std::cout << "Added " << db->size() << " documents" << std::endl;

    // Text query
    search::SearchQuery query;
    query.text = "sales email";
    query.threshold = 0.2f;
    query.limit = 3;
    std::cout << "\nText search: \"sales email\"" << std::endl;
    auto results = db->search(query);
    if (!results) {
        std::cerr << "Search failed: " << results.error().message << std::endl;
        return 1;
    }
    print_results(*results);

    // Same query restricted to templates
    query.filters.types = {DocumentType::Template};
    std::cout << "\nTemplates only:" << std::endl;
    if (auto filtered = db->search(query)) {
        print_results(*filtered);
    }

    std::cout << "\nSimilar to p1:" << std::endl;
    auto similar = db->find_similar_documents("p1", 0.1f, 5);
    if (!similar) {
        std::cerr << "Similarity lookup failed: " << similar.error().message << std::endl;
        return 1;
    }
    print_results(*similar);

    const auto stats = db->get_statistics();
    std::cout << "\nMemory: " << stats.memory_usage.total_mb << " MB, avg search "
              << stats.performance_metrics.avg_search_time_ms << " ms" << std::endl;
    return 0;
}
