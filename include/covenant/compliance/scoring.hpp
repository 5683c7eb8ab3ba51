#pragma once

#include <covenant/schema/attestation.hpp>
#include <covenant/schema/attestation_type.hpp>
#include <covenant/schema/commitment.hpp>
#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Score arithmetic shared by the compliance engine. Two unrelated views are
// computed here: the running score moved by attestation deltas, and the
// recompute derived only from a ledger snapshot. They are not reconciled.
namespace covenant::compliance {

inline constexpr int64_t kBaseScore = 100;
inline constexpr int64_t kActiveDurationBonus = 10;
inline constexpr int64_t kDrawdownPenaltyMultiplier = 2;
inline constexpr int64_t kPositiveAttestationBonus = 1;

inline constexpr int64_t kLowSeverityPenalty = 10;
inline constexpr int64_t kMediumSeverityPenalty = 20;
inline constexpr int64_t kHighSeverityPenalty = 30;

/// The ledger values scoring reads. Unknown commitments score from the
/// zeroed snapshot.
struct commitment_snapshot final {
  covenant::schema::amount_t amount{};
  covenant::schema::amount_t current_value{};
  covenant::schema::timestamp_seconds_t expires_at{};
  uint32_t max_loss_percent{};
};

commitment_snapshot make_snapshot(
    const std::optional<covenant::schema::commitment_t>& commitment);

/// Loss relative to the locked amount in whole percent, truncated. Zero when
/// nothing is locked or the position is in profit.
int64_t drawdown_percent(covenant::schema::amount_t initial,
                         covenant::schema::amount_t current);

uint32_t clamp_score(int64_t score);

/// payload["severity"]: low 10, medium 20, high 30; medium when absent or
/// unrecognized.
int64_t severity_penalty(const covenant::schema::attestation_payload_t& payload);

/// Change one attestation applies to the running score.
int64_t attestation_delta(covenant::schema::attestation_type_t type,
                          const covenant::schema::attestation_payload_t& payload,
                          bool positive);

/// Running score after applying `delta`, clamped to [0, 100].
uint32_t apply_delta(uint32_t score, int64_t delta);

/// 100, plus 10 while unexpired, minus twice the drawdown above the loss
/// tolerance, clamped to [0, 100].
uint32_t recompute_score(const commitment_snapshot& snapshot,
                         covenant::schema::timestamp_seconds_t now);

}  // namespace covenant::compliance
