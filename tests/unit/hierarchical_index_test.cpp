#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <random>
#include <vector>

#include "promptvec/index/hierarchical_index.hpp"
#include "promptvec/kernels/distance.hpp"

using Catch::Matchers::WithinAbs;
using promptvec::HierarchicalIndexParams;
using promptvec::index::FlatIndex;
using promptvec::index::HierarchicalIndex;
using promptvec::core::error_code;

namespace {

auto random_unit(std::mt19937& gen, std::size_t dim) -> std::vector<float> {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    for (auto& x : v) x = dist(gen);
    promptvec::kernels::normalize_in_place(v);
    return v;
}

auto add(FlatIndex& flat, HierarchicalIndex& graph, const std::string& id, std::vector<float> v)
    -> std::uint32_t {
    auto slot = flat.upsert(id, v);
    REQUIRE(slot.has_value());
    REQUIRE(graph.insert(flat, *slot).has_value());
    return *slot;
}

} // anonymous namespace

TEST_CASE("empty graph has no entry point", "[hierarchical]") {
    FlatIndex flat(3);
    HierarchicalIndex graph;
    REQUIRE_FALSE(graph.entry_point().has_value());
    auto r = graph.search(flat, std::vector<float>{1, 0, 0}, 10, 0.0f);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::not_initialized);
}

TEST_CASE("first insert anchors the graph and later inserts stay reachable", "[hierarchical]") {
    FlatIndex flat(3);
    HierarchicalIndex graph;

    const auto a = add(flat, graph, "a", promptvec::kernels::normalized({1, 0, 0}));
    const auto b = add(flat, graph, "b", promptvec::kernels::normalized({0.9f, 0.1f, 0}));
    add(flat, graph, "c", promptvec::kernels::normalized({0, 1, 0}));

    REQUIRE(graph.entry_point() == std::optional<std::uint32_t>(a));
    REQUIRE(graph.size() == 3);

    auto hits = graph.search(flat, std::vector<float>{1, 0, 0}, 20, 0.8f);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 2);
    REQUIRE((*hits)[0].slot == a);
    REQUIRE_THAT((*hits)[0].similarity, WithinAbs(1.0, 1e-6));
    REQUIRE((*hits)[1].slot == b);
}

TEST_CASE("level assignment respects the cap", "[hierarchical]") {
    HierarchicalIndexParams params;
    params.max_level = 2;
    params.level_probability = 0.9f;
    FlatIndex flat(4);
    HierarchicalIndex graph(params);
    std::mt19937 gen(7);
    for (int i = 0; i < 50; ++i) {
        const auto slot = add(flat, graph, "d" + std::to_string(i), random_unit(gen, 4));
        REQUIRE(graph.node_level(slot).value() <= 2u);
        REQUIRE(graph.neighbors(slot, 0).size() <= params.M);
    }
    REQUIRE(graph.max_level().value() <= 2u);
}

TEST_CASE("same seed builds the same topology", "[hierarchical]") {
    std::mt19937 gen(11);
    std::vector<std::vector<float>> data;
    for (int i = 0; i < 40; ++i) data.push_back(random_unit(gen, 8));

    FlatIndex f1(8), f2(8);
    HierarchicalIndex g1, g2;
    for (int i = 0; i < 40; ++i) {
        add(f1, g1, "d" + std::to_string(i), data[i]);
        add(f2, g2, "d" + std::to_string(i), data[i]);
    }
    for (std::uint32_t s = 0; s < 40; ++s) {
        REQUIRE(g1.node_level(s) == g2.node_level(s));
        REQUIRE(g1.neighbors(s, 0) == g2.neighbors(s, 0));
    }
}

TEST_CASE("stored vectors find themselves", "[hierarchical][recall]") {
    const std::size_t dim = 16;
    FlatIndex flat(dim);
    HierarchicalIndex graph;
    std::mt19937 gen(3);
    for (int i = 0; i < 200; ++i) add(flat, graph, "d" + std::to_string(i), random_unit(gen, dim));

    std::size_t found = 0;
    for (std::uint32_t s = 0; s < 200; ++s) {
        auto hits = graph.search(flat, flat.vector(s), 5, -1.0f);
        REQUIRE(hits.has_value());
        if (!hits->empty() && (*hits)[0].slot == s) ++found;
        for (std::size_t i = 1; i < hits->size(); ++i) {
            REQUIRE((*hits)[i - 1].similarity >= (*hits)[i].similarity);
        }
    }
    REQUIRE(found >= 190);
}

TEST_CASE("removal, garbage collection and rebuild", "[hierarchical]") {
    FlatIndex flat(8);
    HierarchicalIndex graph;
    std::mt19937 gen(5);
    for (int i = 0; i < 30; ++i) add(flat, graph, "d" + std::to_string(i), random_unit(gen, 8));

    SECTION("removing the entry point reassigns it") {
        const auto entry = graph.entry_point().value();
        auto slot = flat.remove(flat.id(entry));
        REQUIRE(slot.has_value());
        graph.remove(*slot);
        REQUIRE(graph.entry_point().has_value());
        REQUIRE(graph.entry_point().value() != entry);
        REQUIRE_FALSE(graph.contains(entry));
    }

    SECTION("garbage collection drops lingering links") {
        const std::uint32_t victim = 7;
        REQUIRE(flat.remove(flat.id(victim)).has_value());
        graph.remove(victim);
        graph.garbage_collect(flat);
        REQUIRE_FALSE(graph.is_referenced(victim));

        graph.remap(flat.compact());
        REQUIRE(graph.size() == 29);
        auto hits = graph.search(flat, flat.vector(0), 5, -1.0f);
        REQUIRE(hits.has_value());
        REQUIRE_FALSE(hits->empty());
    }

    SECTION("rebuild re-picks the first live slot") {
        REQUIRE(flat.remove(flat.id(0)).has_value());
        graph.remove(0);
        REQUIRE(graph.rebuild(flat).has_value());
        REQUIRE(graph.entry_point() == std::optional<std::uint32_t>(1u));
        REQUIRE(graph.size() == 29);
        const auto stats = graph.get_stats();
        REQUIRE(stats.n_nodes == 29);
        REQUIRE(stats.n_edges > 0);
        REQUIRE(stats.level_counts.front() == 29);
    }
}

TEST_CASE("relinking an existing slot keeps its level", "[hierarchical]") {
    std::mt19937 gen(13);
    std::vector<std::vector<float>> data;
    for (int i = 0; i < 41; ++i) data.push_back(random_unit(gen, 8));

    FlatIndex f1(8), f2(8);
    HierarchicalIndex g1, g2;
    for (int i = 0; i < 40; ++i) {
        add(f1, g1, "d" + std::to_string(i), data[i]);
        add(f2, g2, "d" + std::to_string(i), data[i]);
    }
    const auto entry = g1.entry_point();
    const auto level5 = g1.node_level(5);

    // Move d5 somewhere else in g1 only.
    add(f1, g1, "d5", random_unit(gen, 8));
    REQUIRE(g1.node_level(5) == level5);
    REQUIRE(g1.entry_point() == entry);
    REQUIRE(g1.size() == 40);

    // The level stream is untouched, so the next new node lands at the same level in both.
    const auto n1 = add(f1, g1, "d40", data[40]);
    const auto n2 = add(f2, g2, "d40", data[40]);
    REQUIRE(n1 == n2);
    REQUIRE(g1.node_level(n1) == g2.node_level(n2));
}
