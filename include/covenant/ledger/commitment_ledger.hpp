#pragma once

#include <covenant/execution/host.hpp>
#include <covenant/registry/ownership_registry.hpp>
#include <covenant/schema/commitment.hpp>
#include <covenant/schema/commitment_rules.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/operation_result.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace covenant::ledger {

/// Canonical commitment records and their lifecycle.
///
/// Active is the only initial status; settled and early_exit are terminal.
/// Every lifecycle change is mirrored into the ownership registry, where this
/// ledger acts as `address()` and must be the registry admin.
class commitment_ledger final {
 public:
  commitment_ledger(covenant::schema::encoding::scale_encoder_t& encoder,
                    covenant::storage::rocksdb_storage_t& storage,
                    covenant::registry::ownership_registry& registry,
                    covenant::execution::host host,
                    covenant::schema::address_t self);

  commitment_ledger(const commitment_ledger&) = delete;
  commitment_ledger& operator=(const commitment_ledger&) = delete;

  covenant::schema::status_t initialize(
      const covenant::schema::address_t& admin);

  /// Lock `amount` of `asset` for `owner` under `rules` and mint the matching
  /// ownership token. Requires the owner's authorization.
  covenant::schema::operation_result<covenant::schema::commitment_id_t>
  create_commitment(const covenant::schema::address_t& owner,
                    covenant::schema::amount_t amount,
                    const covenant::schema::asset_id_t& asset,
                    const covenant::schema::commitment_rules_t& rules);

  /// Admin only. Accepted in every status.
  covenant::schema::status_t update_value(
      const covenant::schema::commitment_id_t& commitment_id,
      covenant::schema::amount_t new_value);

  /// Owner only, once the commitment has expired.
  covenant::schema::status_t settle(
      const covenant::schema::commitment_id_t& commitment_id);

  /// Leave an active commitment before expiry. Returns the penalty owed,
  /// early_exit_penalty_percent of the locked amount; no funds move here.
  covenant::schema::operation_result<covenant::schema::amount_t> early_exit(
      const covenant::schema::commitment_id_t& commitment_id,
      const covenant::schema::address_t& caller);

  covenant::schema::operation_result<covenant::schema::commitment_t>
  get_commitment(const covenant::schema::commitment_id_t& commitment_id) const;

  std::vector<covenant::schema::commitment_id_t> get_owner_commitments(
      const covenant::schema::address_t& owner) const;

  uint64_t get_total_commitments() const;

  std::optional<covenant::schema::address_t> get_admin() const;

  const covenant::schema::address_t& address() const { return self_; }

 private:
  covenant::schema::commitment_id_t make_commitment_id(
      uint64_t sequence,
      const covenant::schema::address_t& owner,
      covenant::schema::timestamp_seconds_t created_at) const;

  std::optional<covenant::schema::commitment_t> load(
      const covenant::schema::commitment_id_t& commitment_id) const;

  void store(const covenant::schema::commitment_t& commitment) const;

  covenant::schema::encoding::scale_encoder_t& encoder_;
  covenant::storage::rocksdb_storage_t& storage_;
  covenant::registry::ownership_registry& registry_;
  covenant::execution::host host_;
  covenant::schema::address_t self_;
};

}  // namespace covenant::ledger
