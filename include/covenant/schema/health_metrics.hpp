#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct health_metrics;

template <>
struct health_metrics<1> final {
  uint16_t version{1};
  commitment_id_t commitment_id{};
  amount_t initial_value{};
  amount_t current_value{};
  int64_t drawdown_percent{};
  amount_t fees_generated{};
  int64_t volatility_exposure{};
  timestamp_seconds_t last_attestation{};
  uint32_t compliance_score{};
};

using health_metrics_t = health_metrics<1>;

}  // namespace covenant::schema
