#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <covenant/compliance/scoring.hpp>
#include <covenant/schema/compliance_state.hpp>
#include <iterator>
#include <string>

using namespace covenant::schema;

namespace covenant::compliance {

commitment_snapshot make_snapshot(const std::optional<commitment_t>& commitment) {
  if (!commitment) {
    return commitment_snapshot{};
  }
  return commitment_snapshot{
      .amount = commitment->amount,
      .current_value = commitment->current_value,
      .expires_at = commitment->expires_at,
      .max_loss_percent = commitment->rules.max_loss_percent};
}

int64_t drawdown_percent(const amount_t initial, const amount_t current) {
  if (initial <= 0) {
    return 0;
  }
  auto wide_initial = boost::multiprecision::int256_t{initial};
  auto loss = wide_initial - boost::multiprecision::int256_t{current};
  if (loss <= 0) {
    return 0;
  }
  auto percent = loss * 100 / wide_initial;
  return percent.convert_to<int64_t>();
}

uint32_t clamp_score(const int64_t score) {
  return static_cast<uint32_t>(
      std::clamp<int64_t>(score, 0, kMaxComplianceScore));
}

int64_t severity_penalty(const attestation_payload_t& payload) {
  auto severity = payload.find("severity");
  if (severity == std::end(payload)) {
    return kMediumSeverityPenalty;
  }
  if (severity->second == "low") {
    return kLowSeverityPenalty;
  }
  if (severity->second == "high") {
    return kHighSeverityPenalty;
  }
  return kMediumSeverityPenalty;
}

int64_t attestation_delta(const attestation_type_t type,
                          const attestation_payload_t& payload,
                          const bool positive) {
  if (type == attestation_type_t::violation) {
    return -severity_penalty(payload);
  }
  return positive ? kPositiveAttestationBonus : 0;
}

uint32_t apply_delta(const uint32_t score, const int64_t delta) {
  return clamp_score(static_cast<int64_t>(score) + delta);
}

uint32_t recompute_score(const commitment_snapshot& snapshot,
                         const timestamp_seconds_t now) {
  auto score = kBaseScore;
  if (now < snapshot.expires_at) {
    score += kActiveDurationBonus;
  }
  auto drawdown = drawdown_percent(snapshot.amount, snapshot.current_value);
  auto tolerance = static_cast<int64_t>(snapshot.max_loss_percent);
  if (drawdown > tolerance) {
    score -= kDrawdownPenaltyMultiplier * (drawdown - tolerance);
  }
  return clamp_score(score);
}

}  // namespace covenant::compliance
