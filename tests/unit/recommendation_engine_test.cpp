#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>

#include "promptvec/analysis/recommendation_engine.hpp"
#include "promptvec_test_helpers.hpp"

using Catch::Matchers::WithinAbs;
using promptvec::Timestamp;
using promptvec::analysis::Interaction;
using promptvec::analysis::InteractionType;
using promptvec::analysis::RecommendationEngine;
using promptvec::analysis::base_weight;
using promptvec::index::FlatIndex;
using promptvec::search::SearchResult;
using promptvec::test::days;
using promptvec::test::small_config;

TEST_CASE("interaction weights", "[recommend]") {
    REQUIRE(base_weight(InteractionType::View) == 0.1);
    REQUIRE(base_weight(InteractionType::Like) == 0.3);
    REQUIRE(base_weight(InteractionType::Use) == 0.5);
    REQUIRE(base_weight(InteractionType::Share) == 0.8);
    REQUIRE(promptvec::analysis::parse_interaction_type("share").value() == InteractionType::Share);
    REQUIRE_FALSE(promptvec::analysis::parse_interaction_type("bookmark").has_value());
}

TEST_CASE("preference vector is the decayed weighted mean", "[recommend]") {
    const auto cfg = small_config(2);
    RecommendationEngine engine(cfg);
    FlatIndex flat(2);
    REQUIRE(flat.upsert("x", std::vector<float>{1, 0}).has_value());
    REQUIRE(flat.upsert("y", std::vector<float>{0, 1}).has_value());
    const Timestamp now{std::chrono::hours(24 * 1000)};

    SECTION("no history or unknown documents yield nothing") {
        REQUIRE_FALSE(engine.preference_vector(flat, {}, now).has_value());
        std::vector<Interaction> unknown{{"ghost", InteractionType::Share, now, std::nullopt}};
        REQUIRE_FALSE(engine.preference_vector(flat, unknown, now).has_value());
    }

    SECTION("zero custom weight contributes nothing") {
        std::vector<Interaction> h{{"x", InteractionType::Like, now, 0.0}};
        REQUIRE_FALSE(engine.preference_vector(flat, h, now).has_value());
    }

    SECTION("weights combine type, recency and custom multiplier") {
        // x: share now -> 0.8; y: share 30 days ago -> 0.8 * e^-1
        std::vector<Interaction> h{
            {"x", InteractionType::Share, now, std::nullopt},
            {"y", InteractionType::Share, now - days(30), std::nullopt},
        };
        auto pref = engine.preference_vector(flat, h, now);
        REQUIRE(pref.has_value());
        const double wx = 0.8, wy = 0.8 * std::exp(-1.0);
        const double norm = std::sqrt(wx * wx + wy * wy);
        REQUIRE_THAT((*pref)[0], WithinAbs(wx / norm, 1e-5));
        REQUIRE_THAT((*pref)[1], WithinAbs(wy / norm, 1e-5));
    }
}

TEST_CASE("recent interactions are excluded and ranks rebuilt", "[recommend]") {
    const auto cfg = small_config(2);
    RecommendationEngine engine(cfg);
    const Timestamp now{std::chrono::hours(24 * 1000)};
    std::vector<Interaction> h{
        {"fresh", InteractionType::View, now - days(2), std::nullopt},
        {"stale", InteractionType::View, now - days(8), std::nullopt},
    };
    const auto recent = engine.recent_documents(h, now);
    REQUIRE(recent == std::set<std::string>{"fresh"});

    const auto q = engine.make_query({1, 0}, 2, recent.size());
    REQUIRE(q.limit == std::optional<std::uint32_t>(3u));
    REQUIRE(q.threshold == std::optional<float>(0.3f));

    std::vector<SearchResult> results(3);
    results[0].document.id = "fresh";
    results[1].document.id = "stale";
    results[2].document.id = "other";
    for (std::uint32_t i = 0; i < 3; ++i) results[i].rank = i + 1;

    const auto out = RecommendationEngine::finalize(results, recent, 2);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].document.id == "stale");
    REQUIRE(out[0].rank == 1);
    REQUIRE(out[1].document.id == "other");
    REQUIRE(out[1].rank == 2);
}
