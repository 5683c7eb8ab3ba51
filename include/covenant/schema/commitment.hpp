#pragma once
#include <covenant/schema/commitment_rules.hpp>
#include <covenant/schema/commitment_status.hpp>
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct commitment;

template <>
struct commitment<1> final {
  uint16_t version{1};
  commitment_id_t commitment_id{};
  address_t owner{};
  token_id_t token_id{};
  commitment_rules_t rules{};
  amount_t amount{};
  asset_id_t asset{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expires_at{};
  amount_t current_value{};
  commitment_status_t status{};
};

using commitment_t = commitment<1>;

}  // namespace covenant::schema
