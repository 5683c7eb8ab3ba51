#pragma once

#include <covenant/common/batch.hpp>
#include <covenant/common/reentrancy_guard.hpp>
#include <covenant/execution/host.hpp>
#include <covenant/schema/batch_mode.hpp>
#include <covenant/schema/batch_result.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/operation_result.hpp>
#include <covenant/schema/ownership_record.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/token_metadata.hpp>
#include <covenant/schema/transfer_request.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace covenant::registry {

/// Tokenized ownership of commitments.
///
/// Keeps the token -> owner mapping, per-owner balances and token lists, and
/// the global list of minted ids. Invariants: every token has exactly one
/// owner and the balances of all owners sum to the number of minted tokens.
///
/// `mint`, `transfer`, `settle`, `early_exit` and `batch_transfer` run under a
/// per-instance reentrancy guard: a collaborator callback (authorizer, event
/// sink) that calls back into any of them while one is in progress is
/// rejected with `reentrancy_detected`.
class ownership_registry final {
 public:
  explicit ownership_registry(
      covenant::schema::encoding::scale_encoder_t& encoder,
      covenant::storage::rocksdb_storage_t& storage,
      covenant::execution::host host,
      covenant::common::batch_limits limits = {});

  ownership_registry(const ownership_registry&) = delete;
  ownership_registry& operator=(const ownership_registry&) = delete;

  /// Record the admin principal (the commitment ledger). One shot.
  covenant::schema::status_t initialize(
      const covenant::schema::address_t& admin);

  /// Mint the next sequential token (ids start at 1) for `owner`.
  ///
  /// Admin only. Rejects zero duration, loss tolerance above 100%, unknown
  /// commitment type and non-positive initial amount.
  covenant::schema::operation_result<covenant::schema::token_id_t> mint(
      const covenant::schema::address_t& owner,
      const covenant::schema::token_metadata_t& metadata);

  /// Move `token_id` from `from` to `to`. Requires `from` to authorize.
  /// Settled and exited tokens remain transferable.
  covenant::schema::status_t transfer(const covenant::schema::address_t& from,
                                      const covenant::schema::address_t& to,
                                      covenant::schema::token_id_t token_id);

  /// Deactivate a matured token. Admin only; fails before expiry and on an
  /// already inactive token.
  covenant::schema::status_t settle(covenant::schema::token_id_t token_id);

  /// Deactivate a token whose commitment exited early, recording the penalty.
  covenant::schema::status_t early_exit(covenant::schema::token_id_t token_id,
                                        covenant::schema::amount_t penalty);

  /// Apply many transfers as one call.
  ///
  /// The size ceiling is checked before anything else. Each entry is checked
  /// against the state left by the entries before it. Balances, owner token
  /// lists and token records are cached for the whole batch and written once
  /// per key in a single atomic commit, which leaves the same state as
  /// applying the successful entries one at a time.
  ///
  /// Atomic mode returns the failing entry's code with nothing applied; the
  /// attached value names the failing index. Best-effort mode succeeds and
  /// lists each skipped entry.
  covenant::schema::operation_result<covenant::schema::batch_result_t>
  batch_transfer(
      const std::vector<covenant::schema::transfer_request_t>& transfers,
      covenant::schema::batch_mode_t mode);

  covenant::schema::operation_result<covenant::schema::address_t> owner_of(
      covenant::schema::token_id_t token_id) const;
  covenant::schema::operation_result<covenant::schema::token_metadata_t>
  get_metadata(covenant::schema::token_id_t token_id) const;
  covenant::schema::operation_result<covenant::schema::ownership_record_t>
  get_token(covenant::schema::token_id_t token_id) const;
  bool is_active(covenant::schema::token_id_t token_id) const;
  uint64_t balance_of(const covenant::schema::address_t& owner) const;
  std::vector<covenant::schema::token_id_t> tokens_of_owner(
      const covenant::schema::address_t& owner) const;
  uint64_t total_supply() const;
  std::vector<covenant::schema::token_id_t> all_token_ids() const;
  std::optional<covenant::schema::address_t> admin() const;

  /// True while a guarded operation is in progress.
  bool guard_held() const { return guard_.held(); }

 private:
  struct transfer_cache;

  covenant::schema::status_t require_admin() const;

  /// Check one transfer against the cache and apply it there. Leaves the
  /// cache untouched on failure.
  covenant::schema::status_t stage_transfer(
      transfer_cache& cache,
      const covenant::schema::transfer_request_t& request);

  /// Turn every dirty cache entry into a staged write.
  void flush(const transfer_cache& cache,
             covenant::storage::write_set& writes) const;

  void publish_transfers(const transfer_cache& cache) const;

  std::optional<covenant::schema::ownership_record_t> load_token(
      covenant::schema::token_id_t token_id) const;

  covenant::schema::encoding::scale_encoder_t& encoder_;
  covenant::storage::rocksdb_storage_t& storage_;
  covenant::execution::host host_;
  covenant::common::batch_limits limits_;
  covenant::common::reentrancy_guard guard_;
};

}  // namespace covenant::registry
