#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>

#include "promptvec/embedding/embedding_provider.hpp"
#include "promptvec/kernels/distance.hpp"

using Catch::Matchers::WithinAbs;
using promptvec::embedding::HashingEmbedder;

TEST_CASE("hashing embedder buckets words by position weight", "[embedding]") {
    HashingEmbedder embedder(16);

    SECTION("single word fills its bucket") {
        // hash("a") == 97, 97 % 16 == 1
        auto v = embedder.embed("a");
        REQUIRE(v.has_value());
        REQUIRE(v->size() == 16);
        REQUIRE_THAT((*v)[1], WithinAbs(1.0, 1e-6));
    }

    SECTION("later words weigh less") {
        auto v = embedder.embed("a b");
        REQUIRE(v.has_value());
        const double norm = std::sqrt(1.0 + 0.25);
        REQUIRE_THAT((*v)[1], WithinAbs(1.0 / norm, 1e-6));
        REQUIRE_THAT((*v)[2], WithinAbs(0.5 / norm, 1e-6));
    }
}

TEST_CASE("hashing embedder normalizes case and whitespace", "[embedding]") {
    HashingEmbedder embedder(32);
    auto a = embedder.embed("Write a Sales EMAIL");
    auto b = embedder.embed("  write a\tsales   email ");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
    REQUIRE_THAT(promptvec::kernels::l2_norm(*a), WithinAbs(1.0, 1e-5));

    auto c = embedder.embed("email sales a write");
    REQUIRE(c.has_value());
    REQUIRE(*c != *a);
}

TEST_CASE("hashing embedder rejects a zero dimension", "[embedding]") {
    HashingEmbedder embedder(0);
    auto v = embedder.embed("anything");
    REQUIRE_FALSE(v.has_value());
    REQUIRE(v.error().code == promptvec::core::error_code::precondition_failed);
}
