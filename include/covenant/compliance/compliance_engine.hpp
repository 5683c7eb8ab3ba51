#pragma once

#include <covenant/execution/host.hpp>
#include <covenant/ledger/commitment_ledger.hpp>
#include <covenant/schema/attestation.hpp>
#include <covenant/schema/attestation_type.hpp>
#include <covenant/schema/compliance_state.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/health_metrics.hpp>
#include <covenant/schema/operation_result.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace covenant::compliance {

/// Attestation store and health scoring for commitments.
///
/// Keeps two scores per commitment. The stored score starts at 100 and moves
/// with every attestation. `calculate_compliance_score` ignores attestations
/// entirely and recomputes from the ledger snapshot. The two are expected to
/// disagree once attestations exist.
class compliance_engine final {
 public:
  /// Without a violation oracle no commitment has an open violation.
  compliance_engine(covenant::schema::encoding::scale_encoder_t& encoder,
                    covenant::storage::rocksdb_storage_t& storage,
                    const covenant::ledger::commitment_ledger& ledger,
                    covenant::execution::host host,
                    covenant::execution::violation_oracle_t violation_oracle = {});

  compliance_engine(const compliance_engine&) = delete;
  compliance_engine& operator=(const compliance_engine&) = delete;

  covenant::schema::status_t initialize(
      const covenant::schema::address_t& admin);

  /// Record an attestation from `caller` and move the stored score: a
  /// violation subtracts its severity penalty, any other positive attestation
  /// adds one. Any caller the authorizer accepts may attest; the caller is
  /// kept as the attestation's verifier.
  covenant::schema::status_t attest(
      const covenant::schema::address_t& caller,
      const covenant::schema::commitment_id_t& commitment_id,
      covenant::schema::attestation_type_t type,
      const covenant::schema::attestation_payload_t& payload,
      bool positive);

  /// Attestations for `commitment_id` in the order they were recorded.
  std::vector<covenant::schema::attestation_t> get_attestations(
      const covenant::schema::commitment_id_t& commitment_id) const;

  uint32_t calculate_compliance_score(
      const covenant::schema::commitment_id_t& commitment_id) const;

  /// Drawdown within tolerance and no open violation. Expiry and the fee
  /// floor are not considered.
  bool verify_compliance(
      const covenant::schema::commitment_id_t& commitment_id) const;

  covenant::schema::health_metrics_t get_health_metrics(
      const covenant::schema::commitment_id_t& commitment_id) const;

  covenant::schema::status_t record_fees(
      const covenant::schema::commitment_id_t& commitment_id,
      covenant::schema::amount_t amount);

  /// Display-only; scoring keeps using the drawdown computed from the ledger.
  covenant::schema::status_t record_drawdown(
      const covenant::schema::commitment_id_t& commitment_id,
      int64_t percent);

  uint32_t get_stored_score(
      const covenant::schema::commitment_id_t& commitment_id) const;

  std::optional<covenant::schema::address_t> get_admin() const;

 private:
  covenant::schema::status_t require_admin() const;

  covenant::schema::compliance_state_t load_state(
      const covenant::schema::commitment_id_t& commitment_id) const;

  std::optional<covenant::schema::commitment_t> snapshot(
      const covenant::schema::commitment_id_t& commitment_id) const;

  covenant::schema::encoding::scale_encoder_t& encoder_;
  covenant::storage::rocksdb_storage_t& storage_;
  const covenant::ledger::commitment_ledger& ledger_;
  covenant::execution::host host_;
  covenant::execution::violation_oracle_t violation_oracle_;
};

}  // namespace covenant::compliance
