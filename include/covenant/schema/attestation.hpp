#pragma once
#include <covenant/schema/attestation_type.hpp>
#include <covenant/schema/primitives.hpp>

#include <map>
#include <string>

namespace covenant::schema {

using attestation_payload_t = std::map<std::string, std::string>;

template <uint16_t Version>
struct attestation;

template <>
struct attestation<1> final {
  uint16_t version{1};
  commitment_id_t commitment_id{};
  attestation_type_t type{attestation_type_t::other};
  attestation_payload_t payload;
  bool positive{};
  address_t verifier{};
  timestamp_seconds_t timestamp{};
};

using attestation_t = attestation<1>;

}  // namespace covenant::schema
