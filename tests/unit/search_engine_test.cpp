#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "promptvec/search/search_engine.hpp"
#include "promptvec_test_helpers.hpp"

using Catch::Matchers::WithinAbs;
using promptvec::DocumentType;
using promptvec::embedding::EmbeddingProvider;
using promptvec::embedding::HashingEmbedder;
using promptvec::search::SearchEngine;
using promptvec::search::SearchQuery;
using promptvec::store::DocumentStore;
using promptvec::test::make_doc;
using promptvec::test::small_config;
using promptvec::core::error_code;

namespace {

struct FailingEmbedder final : EmbeddingProvider {
    auto embed(std::string_view) -> std::expected<std::vector<float>, promptvec::core::error> override {
        return std::unexpected(promptvec::core::error{error_code::internal, "model offline", "test"});
    }
};

auto run(SearchEngine& engine, DocumentStore& store, const SearchQuery& q)
    -> std::vector<promptvec::search::SearchResult> {
    HashingEmbedder embedder(store.dimension());
    auto v = engine.resolve(q, embedder);
    REQUIRE(v.has_value());
    return engine.execute(store, q, *v, engine.cache_key(q));
}

} // anonymous namespace

TEST_CASE("three-document example", "[search]") {
    const auto cfg = small_config(3);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    REQUIRE(store.upsert(make_doc("doc1", {1, 0, 0})).has_value());
    REQUIRE(store.upsert(make_doc("doc2", {0.9f, 0.1f, 0})).has_value());
    REQUIRE(store.upsert(make_doc("doc3", {0, 1, 0})).has_value());

    SearchQuery q;
    q.vector = std::vector<float>{1, 0, 0};
    q.threshold = 0.8f;
    const auto results = run(engine, store, q);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].document.id == "doc1");
    REQUIRE(results[0].rank == 1);
    REQUIRE_THAT(results[0].similarity, WithinAbs(1.0, 1e-6));
    REQUIRE(results[1].document.id == "doc2");
    REQUIRE(results[1].rank == 2);
}

TEST_CASE("query validation", "[search]") {
    const auto cfg = small_config(3);
    SearchEngine engine(cfg);
    HashingEmbedder embedder(3);

    SECTION("neither vector nor text") {
        auto r = engine.resolve(SearchQuery{}, embedder);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::invalid_argument);
    }
    SECTION("wrong query dimension") {
        SearchQuery q;
        q.vector = std::vector<float>{1, 0};
        REQUIRE_FALSE(engine.resolve(q, embedder).has_value());
    }
    SECTION("zero limit") {
        SearchQuery q;
        q.vector = std::vector<float>{1, 0, 0};
        q.limit = 0;
        REQUIRE_FALSE(engine.resolve(q, embedder).has_value());
    }
    SECTION("embedding failures surface as internal errors") {
        FailingEmbedder failing;
        SearchQuery q;
        q.text = "hello";
        auto r = engine.resolve(q, failing);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::internal);
    }
    SECTION("text is embedded and normalized") {
        SearchQuery q;
        q.text = "write a follow up email";
        auto r = engine.resolve(q, embedder);
        REQUIRE(r.has_value());
        REQUIRE(r->size() == 3);
    }
}

TEST_CASE("empty corpus returns no results", "[search]") {
    const auto cfg = small_config(3);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    SearchQuery q;
    q.vector = std::vector<float>{1, 0, 0};
    REQUIRE(run(engine, store, q).empty());
}

TEST_CASE("limit, ordering and contiguous ranks", "[search]") {
    auto cfg = small_config(4);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    for (int i = 0; i < 40; ++i) {
        const float x = static_cast<float>(i) / 40.0f;
        REQUIRE(store.upsert(make_doc("d" + std::to_string(i), {1.0f, x, x * x, 0.1f})).has_value());
    }

    SearchQuery q;
    q.vector = std::vector<float>{1, 0.5f, 0.25f, 0.1f};
    q.limit = 7;
    q.threshold = -1.0f;
    const auto results = run(engine, store, q);

    REQUIRE(results.size() == 7);
    for (std::size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].rank == i + 1);
        if (i > 0) REQUIRE(results[i - 1].similarity >= results[i].similarity);
    }
}

TEST_CASE("metadata filters are applied to candidates", "[search][filter]") {
    const auto cfg = small_config(2);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    auto a = make_doc("a", {1, 0}, "sales", DocumentType::Template, {"email"});
    a.metadata.effectiveness = 0.9;
    auto b = make_doc("b", {1, 0.1f}, "support", DocumentType::Template, {"chat"});
    b.metadata.effectiveness = 0.4;
    auto c = make_doc("c", {1, 0.2f}, "sales", DocumentType::Prompt, {"chat"});
    REQUIRE(store.upsert(a).has_value());
    REQUIRE(store.upsert(b).has_value());
    REQUIRE(store.upsert(c).has_value());

    SearchQuery q;
    q.vector = std::vector<float>{1, 0};

    SECTION("domain") {
        q.filters.domains = {"sales"};
        const auto r = run(engine, store, q);
        REQUIRE(r.size() == 2);
        REQUIRE(r[0].document.id == "a");
        REQUIRE(r[1].document.id == "c");
    }
    SECTION("type and tag") {
        q.filters.types = {DocumentType::Template};
        q.filters.tags = {"chat"};
        const auto r = run(engine, store, q);
        REQUIRE(r.size() == 1);
        REQUIRE(r[0].document.id == "b");
    }
    SECTION("effectiveness treats missing values as zero") {
        q.filters.effectiveness_min = 0.3;
        const auto r = run(engine, store, q);
        REQUIRE(r.size() == 2);
        REQUIRE(r[1].document.id == "b");
    }
}

TEST_CASE("results are cached until invalidated", "[search][cache]") {
    const auto cfg = small_config(2);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    REQUIRE(store.upsert(make_doc("a", {1, 0})).has_value());

    SearchQuery q;
    q.vector = std::vector<float>{1, 0};
    const auto key = engine.cache_key(q);
    REQUIRE_FALSE(engine.cached(key).has_value());

    const auto first = run(engine, store, q);
    auto hit = engine.cached(key);
    REQUIRE(hit.has_value());
    REQUIRE(hit->size() == first.size());

    engine.invalidate();
    REQUIRE_FALSE(engine.cached(key).has_value());
}

TEST_CASE("cache keys distinguish query parameters", "[search][cache]") {
    const auto cfg = small_config(2);
    SearchEngine engine(cfg);
    SearchQuery q;
    q.vector = std::vector<float>{1, 0};
    const auto base = engine.cache_key(q);

    auto with_limit = q;
    with_limit.limit = 5;
    auto with_text = q;
    with_text.text = "x";
    auto with_filter = q;
    with_filter.filters.domains = {"sales"};

    REQUIRE(base == engine.cache_key(q));
    REQUIRE(base != engine.cache_key(with_limit));
    REQUIRE(base != engine.cache_key(with_text));
    REQUIRE(base != engine.cache_key(with_filter));
}

TEST_CASE("search after every earlier document was deleted", "[search]") {
    const auto cfg = small_config(2);
    DocumentStore store(cfg);
    SearchEngine engine(cfg);
    REQUIRE(store.upsert(make_doc("a", {1, 0})).has_value());
    REQUIRE(store.upsert(make_doc("b", {0, 1})).has_value());
    REQUIRE(store.remove("a").has_value());
    REQUIRE(store.remove("b").has_value());
    REQUIRE(store.upsert(make_doc("c", {1, 1})).has_value());

    SearchQuery q;
    q.vector = std::vector<float>{1, 1};
    const auto r = run(engine, store, q);
    REQUIRE(r.size() == 1);
    REQUIRE(r[0].document.id == "c");
}
