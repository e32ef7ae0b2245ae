#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include "promptvec/core/platform_utils.hpp"

#if defined(_WIN32)
  #include <cstdlib>
#else
  #include <cstdlib>
#endif

using promptvec::core::safe_getenv;
using promptvec::core::getenv_nonempty;
using promptvec::core::parse_bool_ci;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "PROMPTVEC_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "PROMPTVEC_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

#if !defined(_WIN32)
TEST_CASE("getenv_nonempty treats an empty value as unset", "[platform][env]") {
    const char* key = "PROMPTVEC_TEST_SAFE_GETENV_EMPTY";
    set_env_var(key, "");
    REQUIRE(safe_getenv(key).has_value());
    REQUIRE_FALSE(getenv_nonempty(key).has_value());
    unset_env_var(key);
}
#endif

TEST_CASE("parse_bool_ci accepts 1/0 and true in any case", "[platform][env]") {
    REQUIRE(parse_bool_ci("1"));
    REQUIRE_FALSE(parse_bool_ci("0"));
    REQUIRE(parse_bool_ci("TRUE"));
    REQUIRE(parse_bool_ci("True"));
    REQUIRE_FALSE(parse_bool_ci("false"));
    REQUIRE_FALSE(parse_bool_ci("yes"));
    REQUIRE_FALSE(parse_bool_ci(""));
}
