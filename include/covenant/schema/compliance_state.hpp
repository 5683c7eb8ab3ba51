#pragma once
#include <covenant/schema/primitives.hpp>

#include <optional>

// Schema type: compliance state.
// Per-commitment values owned by the compliance engine. Everything else shown
// in health metrics is derived from the ledger at read time.
namespace covenant::schema {

inline constexpr uint32_t kMaxComplianceScore = 100;

template <uint16_t Version>
struct compliance_state;

template <>
struct compliance_state<1> final {
  uint16_t version{1};
  commitment_id_t commitment_id{};
  amount_t fees_generated{};
  uint32_t compliance_score{kMaxComplianceScore};
  timestamp_seconds_t last_attestation{};
  uint64_t attestation_count{};
  std::optional<int64_t> drawdown_override;
};

using compliance_state_t = compliance_state<1>;

}  // namespace covenant::schema
