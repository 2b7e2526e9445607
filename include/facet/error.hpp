#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes grouped by thousands for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Request-boundary codes (10xxx) are produced before any pool is touched.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace facet::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  unavailable = 7001,
  internal = 9001,
  invalid_argument = 9002,
  invalid_query = 10001,
  unknown_dataset = 10002,
  unknown_filter_key = 10003,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "pool.load" */
};

/** \brief Short stable name of an error code, e.g. "unknown_filter_key". */
constexpr auto to_string(error_code c) noexcept -> std::string_view {
  switch (c) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::invalid_query: return "invalid_query";
    case error_code::unknown_dataset: return "unknown_dataset";
    case error_code::unknown_filter_key: return "unknown_filter_key";
  }
  return "unknown";
}

} // namespace facet::core
