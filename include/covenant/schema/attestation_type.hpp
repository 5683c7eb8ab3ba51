#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: attestation type.
// Kind of claim a verifier records about a commitment.
namespace covenant::schema {

enum class attestation_type_t : uint8_t {
  health_check = 0,
  violation = 1,
  fee_generation = 2,
  drawdown = 3,
  other = 4
};

inline constexpr auto kAttestationTypeMappings = std::array{
    std::pair<std::string_view, attestation_type_t>{
        "health_check", attestation_type_t::health_check},
    std::pair<std::string_view, attestation_type_t>{
        "violation", attestation_type_t::violation},
    std::pair<std::string_view, attestation_type_t>{
        "fee_generation", attestation_type_t::fee_generation},
    std::pair<std::string_view, attestation_type_t>{
        "drawdown", attestation_type_t::drawdown},
    std::pair<std::string_view, attestation_type_t>{"other",
                                                    attestation_type_t::other}};

template <>
inline std::optional<attestation_type_t> try_from_string<attestation_type_t>(
    const std::string_view value) {
  return from_string(value, kAttestationTypeMappings);
}

inline constexpr std::string_view to_string(const attestation_type_t value) {
  return to_string(value, kAttestationTypeMappings).value_or("unknown");
}

inline constexpr bool is_known(const attestation_type_t value) {
  return to_string(value, kAttestationTypeMappings).has_value();
}

}  // namespace covenant::schema
