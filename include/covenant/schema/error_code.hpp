#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: error code.
// Rejection reasons shared by the ledger, registry and compliance engine.
// Codes are grouped by category so callers can tell bad input from state
// conflicts, re-entry and authorization failures.
namespace covenant::schema {

enum class error_code : uint32_t {
  ok = 0,

  invalid_amount = 1,
  invalid_duration = 2,
  invalid_max_loss = 3,
  invalid_penalty = 4,
  invalid_commitment_type = 5,
  batch_too_large = 6,

  already_initialized = 20,
  not_initialized = 21,
  already_settled = 22,
  not_expired = 23,
  invalid_status_transition = 24,
  commitment_not_found = 25,
  token_not_found = 26,
  not_owner = 27,

  reentrancy_detected = 40,

  authorization_denied = 50,
};

enum class error_category_t : uint8_t {
  none = 0,
  validation = 1,
  state = 2,
  concurrency = 3,
  authorization = 4
};

inline constexpr error_category_t category_of(const error_code code) {
  const auto raw = static_cast<uint32_t>(code);
  if (raw == 0) {
    return error_category_t::none;
  }
  if (raw < 20) {
    return error_category_t::validation;
  }
  if (raw < 40) {
    return error_category_t::state;
  }
  if (raw < 50) {
    return error_category_t::concurrency;
  }
  return error_category_t::authorization;
}

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"invalid_amount",
                                            error_code::invalid_amount},
    std::pair<std::string_view, error_code>{"invalid_duration",
                                            error_code::invalid_duration},
    std::pair<std::string_view, error_code>{"invalid_max_loss",
                                            error_code::invalid_max_loss},
    std::pair<std::string_view, error_code>{"invalid_penalty",
                                            error_code::invalid_penalty},
    std::pair<std::string_view, error_code>{
        "invalid_commitment_type", error_code::invalid_commitment_type},
    std::pair<std::string_view, error_code>{"batch_too_large",
                                            error_code::batch_too_large},
    std::pair<std::string_view, error_code>{"already_initialized",
                                            error_code::already_initialized},
    std::pair<std::string_view, error_code>{"not_initialized",
                                            error_code::not_initialized},
    std::pair<std::string_view, error_code>{"already_settled",
                                            error_code::already_settled},
    std::pair<std::string_view, error_code>{"not_expired",
                                            error_code::not_expired},
    std::pair<std::string_view, error_code>{
        "invalid_status_transition", error_code::invalid_status_transition},
    std::pair<std::string_view, error_code>{"commitment_not_found",
                                            error_code::commitment_not_found},
    std::pair<std::string_view, error_code>{"token_not_found",
                                            error_code::token_not_found},
    std::pair<std::string_view, error_code>{"not_owner",
                                            error_code::not_owner},
    std::pair<std::string_view, error_code>{"reentrancy_detected",
                                            error_code::reentrancy_detected},
    std::pair<std::string_view, error_code>{"authorization_denied",
                                            error_code::authorization_denied}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace covenant::schema
