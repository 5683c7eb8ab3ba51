#pragma once
#include <covenant/schema/commitment_type.hpp>
#include <covenant/schema/primitives.hpp>

// Schema type: token metadata.
// Snapshot of the commitment terms taken when the ownership token is minted.
namespace covenant::schema {

template <uint16_t Version>
struct token_metadata;

template <>
struct token_metadata<1> final {
  uint16_t version{1};
  commitment_id_t commitment_id{};
  uint32_t duration_days{};
  uint32_t max_loss_percent{};
  commitment_type_t commitment_type{commitment_type_t::safe};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expires_at{};
  amount_t initial_amount{};
  asset_id_t asset{};
};

using token_metadata_t = token_metadata<1>;

}  // namespace covenant::schema
