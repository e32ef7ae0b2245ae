#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Validation failures (bad input) and lookups of unknown ids are surfaced to the
 *   caller synchronously; provider failures are wrapped as internal errors.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace promptvec::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.add" */
};

/** \brief Input rejected before any state changed (dimension, query, k, config). */
inline auto is_validation_error(const error& e) noexcept -> bool {
  return e.code == error_code::invalid_argument ||
         e.code == error_code::config_invalid ||
         e.code == error_code::precondition_failed;
}

inline auto is_not_found(const error& e) noexcept -> bool {
  return e.code == error_code::not_found;
}

/** \brief Short stable name for logs and diagnostics. */
constexpr auto to_string(error_code ec) noexcept -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

} // namespace promptvec::core
