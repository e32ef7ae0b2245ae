#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "promptvec/index/scalar_quantizer.hpp"

using Catch::Matchers::WithinAbs;
using promptvec::index::FlatIndex;
using promptvec::index::ScalarQuantizer;
using promptvec::core::error_code;

TEST_CASE("quantizer calibrates from the global component range", "[quantizer]") {
    FlatIndex flat(2);
    ScalarQuantizer sq(2);

    auto uncalibrated = sq.quantize(std::vector<float>{0, 0});
    REQUIRE_FALSE(uncalibrated.has_value());
    REQUIRE(uncalibrated.error().code == error_code::not_initialized);

    REQUIRE(flat.upsert("a", std::vector<float>{-1.0f, 0.0f}).has_value());
    REQUIRE(flat.upsert("b", std::vector<float>{1.0f, 0.5f}).has_value());
    REQUIRE(sq.recalibrate(flat));

    const auto p = sq.params();
    REQUIRE(p.has_value());
    REQUIRE_THAT(p->offset, WithinAbs(-1.0, 1e-6));
    REQUIRE_THAT(p->scale, WithinAbs(2.0 / 255.0, 1e-6));

    auto codes = sq.quantize(std::vector<float>{-1.0f, 1.0f});
    REQUIRE(codes.has_value());
    REQUIRE((*codes)[0] == 0);
    REQUIRE((*codes)[1] == 255);

    SECTION("out-of-range components clamp") {
        auto clamped = sq.quantize(std::vector<float>{-5.0f, 5.0f});
        REQUIRE(clamped.has_value());
        REQUIRE((*clamped)[0] == 0);
        REQUIRE((*clamped)[1] == 255);
    }

    SECTION("dequantize approximates the input") {
        auto q = sq.quantize(std::vector<float>{0.3f, -0.2f});
        REQUIRE(q.has_value());
        auto back = sq.dequantize(*q);
        REQUIRE(back.has_value());
        REQUIRE_THAT((*back)[0], WithinAbs(0.3, 2.0 / 255.0));
        REQUIRE_THAT((*back)[1], WithinAbs(-0.2, 2.0 / 255.0));
    }

    SECTION("dimension mismatch") {
        auto bad = sq.quantize(std::vector<float>{0.0f});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == error_code::invalid_argument);
    }
}

TEST_CASE("empty corpus leaves the quantizer uncalibrated", "[quantizer]") {
    FlatIndex flat(2);
    ScalarQuantizer sq(2);
    REQUIRE_FALSE(sq.recalibrate(flat));
    REQUIRE_FALSE(sq.params().has_value());
}

TEST_CASE("degenerate range calibrates to unit scale", "[quantizer]") {
    FlatIndex flat(2);
    ScalarQuantizer sq(2);
    REQUIRE(flat.upsert("a", std::vector<float>{0.5f, 0.5f}).has_value());
    REQUIRE(sq.recalibrate(flat));
    REQUIRE(sq.params()->scale == 1.0f);
    REQUIRE(sq.params()->offset == 0.5f);
}

TEST_CASE("stored codes follow slot lifecycle", "[quantizer]") {
    FlatIndex flat(2);
    ScalarQuantizer sq(2);
    for (const char* id : {"a", "b", "c"}) {
        auto slot = flat.upsert(id, std::vector<float>{1.0f, 0.0f});
        REQUIRE(slot.has_value());
        REQUIRE(sq.encode_slot(flat, *slot).has_value());
    }
    REQUIRE(sq.size() == 3);
    REQUIRE(sq.memory_bytes() == 6);

    auto removed = flat.remove("b");
    REQUIRE(removed.has_value());
    sq.erase(*removed);
    REQUIRE(sq.size() == 2);
    REQUIRE_FALSE(sq.codes(*removed).has_value());

    sq.remap(flat.compact());
    REQUIRE(sq.size() == 2);
    REQUIRE(sq.codes(0).has_value());
    REQUIRE(sq.codes(1).has_value());
    REQUIRE_FALSE(sq.codes(2).has_value());
}

TEST_CASE("recalibration re-encodes stored codes", "[quantizer]") {
    FlatIndex flat(2);
    ScalarQuantizer sq(2);
    auto a = flat.upsert("a", std::vector<float>{0.0f, 1.0f});
    REQUIRE(a.has_value());
    REQUIRE(sq.encode_slot(flat, *a).has_value());
    const std::vector<std::uint8_t> before((*sq.codes(*a)).begin(), (*sq.codes(*a)).end());

    REQUIRE(flat.upsert("b", std::vector<float>{-1.0f, 0.0f}).has_value());
    REQUIRE(sq.recalibrate(flat));
    const std::vector<std::uint8_t> after((*sq.codes(*a)).begin(), (*sq.codes(*a)).end());
    REQUIRE(before != after);
    REQUIRE(after[1] == 255);
}
