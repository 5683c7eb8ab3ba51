#pragma once
#include <covenant/schema/commitment_type.hpp>
#include <covenant/schema/primitives.hpp>

// Schema type: commitment rules.
// Terms fixed at creation: lock duration, loss tolerance, risk profile, exit
// penalty, fee floor and settlement grace period.
namespace covenant::schema {

template <uint16_t Version>
struct commitment_rules;

template <>
struct commitment_rules<1> final {
  uint16_t version{1};
  uint32_t duration_days{};
  uint32_t max_loss_percent{};
  commitment_type_t commitment_type{commitment_type_t::safe};
  uint32_t early_exit_penalty_percent{};
  amount_t min_fee_threshold{};
  uint32_t grace_period_days{};
};

using commitment_rules_t = commitment_rules<1>;

}  // namespace covenant::schema
