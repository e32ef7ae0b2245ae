#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "promptvec/kernels/distance.hpp"

using Catch::Matchers::WithinAbs;
using namespace promptvec::kernels;

TEST_CASE("inner product and norm", "[kernels]") {
    std::vector<float> a{1, 2, 3, 4, 5};
    std::vector<float> b{5, 4, 3, 2, 1};
    REQUIRE_THAT(inner_product(a, b), WithinAbs(35.0, 1e-5));
    REQUIRE_THAT(l2_norm(std::vector<float>{3, 4}), WithinAbs(5.0, 1e-6));
}

TEST_CASE("cosine similarity", "[kernels][cosine]") {
    std::vector<float> x{1, 0, 0};
    std::vector<float> y{0, 1, 0};
    std::vector<float> z{0, 0, 0};

    REQUIRE_THAT(cosine_similarity(x, x), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(cosine_similarity(x, y), WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(cosine_similarity(x, std::vector<float>{-2, 0, 0}), WithinAbs(-1.0, 1e-6));
    REQUIRE(cosine_similarity(x, z) == 0.0f);
    REQUIRE_THAT(cosine_distance(x, y), WithinAbs(1.0, 1e-6));

    // Scale invariance
    REQUIRE_THAT(cosine_similarity(std::vector<float>{0.9f, 0.1f, 0}, std::vector<float>{9, 1, 0}),
                 WithinAbs(1.0, 1e-6));
}

TEST_CASE("normalization", "[kernels]") {
    auto v = normalized({3, 0, 4});
    REQUIRE_THAT(l2_norm(v), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(v[0], WithinAbs(0.6, 1e-6));

    std::vector<float> zero{0, 0, 0};
    normalize_in_place(zero);
    REQUIRE(zero == std::vector<float>{0, 0, 0});
}

TEST_CASE("centroid", "[kernels]") {
    std::vector<float> a{1, 0}, b{0, 1};
    std::vector<std::span<const float>> vs{a, b};
    auto c = centroid(vs, 2);
    REQUIRE_THAT(c[0], WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(c[1], WithinAbs(0.5, 1e-6));
    REQUIRE(centroid({}, 3) == std::vector<float>{0, 0, 0});
}
