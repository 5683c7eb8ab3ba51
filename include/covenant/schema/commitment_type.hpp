#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: commitment type.
// Risk profile chosen at creation; mirrored into the ownership token.
namespace covenant::schema {

enum class commitment_type_t : uint8_t {
  safe = 0,
  balanced = 1,
  aggressive = 2
};

inline constexpr auto kCommitmentTypeMappings = std::array{
    std::pair<std::string_view, commitment_type_t>{"safe",
                                                   commitment_type_t::safe},
    std::pair<std::string_view, commitment_type_t>{
        "balanced", commitment_type_t::balanced},
    std::pair<std::string_view, commitment_type_t>{
        "aggressive", commitment_type_t::aggressive}};

template <>
inline std::optional<commitment_type_t> try_from_string<commitment_type_t>(
    const std::string_view value) {
  return from_string(value, kCommitmentTypeMappings);
}

inline constexpr std::string_view to_string(const commitment_type_t value) {
  return to_string(value, kCommitmentTypeMappings).value_or("unknown");
}

/// False for values outside the declared enumerators (e.g. decoded or cast
/// from an untrusted integer).
inline constexpr bool is_known(const commitment_type_t value) {
  return to_string(value, kCommitmentTypeMappings).has_value();
}

}  // namespace covenant::schema
