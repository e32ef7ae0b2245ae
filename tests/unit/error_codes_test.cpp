#include <catch2/catch_test_macros.hpp>
#include <string>

#include "promptvec/error.hpp"

using namespace promptvec::core;

TEST_CASE("error codes keep their stable numeric values", "[error]") {
    REQUIRE(static_cast<std::uint32_t>(error_code::ok) == 0u);
    REQUIRE(static_cast<std::uint32_t>(error_code::config_invalid) == 2001u);
    REQUIRE(static_cast<std::uint32_t>(error_code::not_found) == 6001u);
    REQUIRE(static_cast<std::uint32_t>(error_code::internal) == 9001u);
    REQUIRE(static_cast<std::uint32_t>(error_code::invalid_argument) == 9002u);
    REQUIRE(static_cast<std::uint32_t>(error_code::unsupported) == 9005u);
    REQUIRE(static_cast<std::uint32_t>(error_code::precondition_failed) == 4001u);
    REQUIRE(static_cast<std::uint32_t>(error_code::not_initialized) == 9003u);
}

TEST_CASE("error classification helpers", "[error]") {
    REQUIRE(is_validation_error(error{error_code::invalid_argument, "x", "t"}));
    REQUIRE(is_validation_error(error{error_code::config_invalid, "x", "t"}));
    REQUIRE_FALSE(is_validation_error(error{error_code::not_found, "x", "t"}));
    REQUIRE(is_not_found(error{error_code::not_found, "x", "t"}));
    REQUIRE_FALSE(is_not_found(error{error_code::internal, "x", "t"}));
}

TEST_CASE("error code names", "[error]") {
    REQUIRE(std::string(to_string(error_code::not_found)) == "not_found");
    REQUIRE(std::string(to_string(error_code::unsupported)) == "unsupported");
    REQUIRE(std::string(to_string(error_code::not_initialized)) == "not_initialized");
    REQUIRE(std::string(to_string(error_code::precondition_failed)) == "precondition_failed");
    STATIC_REQUIRE(to_string(error_code::ok)[0] == 'o');
}
