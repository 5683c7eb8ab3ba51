#include <covenant/compliance/compliance_engine.hpp>
#include <covenant/testing/covenant_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace {

using covenant::schema::attestation_payload_t;
using covenant::schema::amount_t;
using covenant::schema::attestation_type_t;
using covenant::schema::error_code;
using covenant::testing::covenant_fixture;
using covenant::testing::make_address;
using covenant::testing::make_hash;
using covenant::testing::make_rules;

const attestation_payload_t kHighSeverity{{"severity", "high"}};
const attestation_payload_t kMediumSeverity{{"severity", "medium"}};

}  // namespace

TEST(compliance_engine, initialize_is_one_shot) {
  auto fixture = covenant_fixture{"covenant_compliance_init"};
  ASSERT_TRUE(fixture.initialize());
  EXPECT_EQ(fixture.compliance().initialize(make_address(3)).code,
            error_code::already_initialized);
  EXPECT_EQ(*fixture.compliance().get_admin(), covenant_fixture::admin());
}

TEST(compliance_engine, stored_score_defaults_to_full) {
  auto fixture = covenant_fixture{"covenant_compliance_default"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 100u);
  EXPECT_EQ(fixture.compliance().get_stored_score(make_hash(99)), 100u);
}

TEST(compliance_engine, violations_clamp_stored_score_at_zero) {
  auto fixture = covenant_fixture{"covenant_compliance_clamp"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  auto admin = covenant_fixture::admin();

  for (auto i = 0; i < 5; ++i) {
    ASSERT_TRUE(fixture.compliance()
                    .attest(admin, id, attestation_type_t::violation,
                            kHighSeverity, false)
                    .ok());
  }
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 0u);
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).compliance_score, 0u);
}

TEST(compliance_engine, stored_and_recomputed_scores_diverge) {
  auto fixture = covenant_fixture{"covenant_compliance_duality"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(30, 10));

  EXPECT_EQ(fixture.compliance().calculate_compliance_score(id), 100u);
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 100u);

  ASSERT_TRUE(fixture.compliance()
                  .attest(covenant_fixture::admin(), id,
                          attestation_type_t::violation, kMediumSeverity, false)
                  .ok());
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 80u);
  EXPECT_EQ(fixture.compliance().calculate_compliance_score(id), 100u);
}

TEST(compliance_engine, positive_attestation_adds_one) {
  auto fixture = covenant_fixture{"covenant_compliance_positive"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  auto admin = covenant_fixture::admin();

  ASSERT_TRUE(fixture.compliance()
                  .attest(admin, id, attestation_type_t::violation, {}, false)
                  .ok());
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 80u);
  ASSERT_TRUE(fixture.compliance()
                  .attest(admin, id, attestation_type_t::health_check,
                          {{"note", "ok"}, {"extra", "ignored"}}, true)
                  .ok());
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 81u);
  ASSERT_TRUE(fixture.compliance()
                  .attest(admin, id, attestation_type_t::fee_generation, {},
                          false)
                  .ok());
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 81u);
}

TEST(compliance_engine, recompute_penalizes_drawdown) {
  auto fixture = covenant_fixture{"covenant_compliance_drawdown"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(30, 10));
  ASSERT_TRUE(fixture.ledger().update_value(id, 700).ok());

  EXPECT_EQ(fixture.compliance().calculate_compliance_score(id), 70u);
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).drawdown_percent, 30);
  EXPECT_FALSE(fixture.compliance().verify_compliance(id));

  fixture.advance_days(30);
  EXPECT_EQ(fixture.compliance().calculate_compliance_score(id), 60u);
}

TEST(compliance_engine, unknown_commitment_uses_zeroed_snapshot) {
  auto fixture = covenant_fixture{"covenant_compliance_unknown"};
  ASSERT_TRUE(fixture.initialize());
  auto unknown = make_hash(42);

  EXPECT_EQ(fixture.compliance().calculate_compliance_score(unknown), 100u);
  EXPECT_TRUE(fixture.compliance().verify_compliance(unknown));

  auto metrics = fixture.compliance().get_health_metrics(unknown);
  EXPECT_EQ(metrics.commitment_id, unknown);
  EXPECT_EQ(metrics.initial_value, 0);
  EXPECT_EQ(metrics.current_value, 0);
  EXPECT_EQ(metrics.drawdown_percent, 0);
  EXPECT_EQ(metrics.compliance_score, 100u);
}

TEST(compliance_engine, verify_compliance_consults_violation_oracle) {
  auto fixture = covenant_fixture{"covenant_compliance_oracle"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(1, 10));
  ASSERT_TRUE(fixture.ledger().update_value(id, 900).ok());
  EXPECT_TRUE(fixture.compliance().verify_compliance(id));

  // Expiry does not affect the verdict.
  fixture.advance_days(5);
  EXPECT_TRUE(fixture.compliance().verify_compliance(id));

  fixture.flag_violation(id);
  EXPECT_FALSE(fixture.compliance().verify_compliance(id));
}

TEST(compliance_engine, any_authorized_caller_may_attest) {
  auto fixture = covenant_fixture{"covenant_compliance_attester"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  auto attester = make_address(50);
  fixture.require_explicit_auth();
  fixture.authorize(attester);

  ASSERT_TRUE(fixture.compliance()
                  .attest(attester, id, attestation_type_t::health_check, {},
                          true)
                  .ok());

  auto history = fixture.compliance().get_attestations(id);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].verifier, attester);
  EXPECT_EQ(history[0].type, attestation_type_t::health_check);
  EXPECT_EQ(fixture.compliance().get_stored_score(id), 100u);
  EXPECT_EQ(fixture.count_events("attestation"), 1u);
}

TEST(compliance_engine, attest_requires_caller_authorization) {
  auto fixture = covenant_fixture{"covenant_compliance_attest_auth"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  fixture.require_explicit_auth();

  EXPECT_EQ(fixture.compliance()
                .attest(covenant_fixture::admin(), id,
                        attestation_type_t::health_check, {}, true)
                .code,
            error_code::authorization_denied);
  EXPECT_TRUE(fixture.compliance().get_attestations(id).empty());
}

TEST(compliance_engine, attestations_kept_in_order) {
  auto fixture = covenant_fixture{"covenant_compliance_history"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  auto other = fixture.create(make_address(2));
  auto admin = covenant_fixture::admin();

  auto types = {attestation_type_t::health_check, attestation_type_t::drawdown,
                attestation_type_t::violation, attestation_type_t::other};
  for (const auto type : types) {
    fixture.advance_days(1);
    ASSERT_TRUE(fixture.compliance()
                    .attest(admin, id, type, {{"step", "x"}}, true)
                    .ok());
  }
  ASSERT_TRUE(fixture.compliance()
                  .attest(admin, other, attestation_type_t::other, {}, true)
                  .ok());

  auto history = fixture.compliance().get_attestations(id);
  ASSERT_EQ(history.size(), 4u);
  auto expected = std::begin(types);
  for (std::size_t i = 0; i < history.size(); ++i, ++expected) {
    EXPECT_EQ(history[i].type, *expected);
    EXPECT_EQ(history[i].commitment_id, id);
    EXPECT_EQ(history[i].verifier, admin);
    EXPECT_EQ(history[i].payload.at("step"), "x");
  }
  EXPECT_LT(history[0].timestamp, history[3].timestamp);
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).last_attestation,
            history[3].timestamp);
  EXPECT_EQ(fixture.compliance().get_attestations(other).size(), 1u);
  EXPECT_EQ(fixture.count_events("attestation"), 5u);
}

TEST(compliance_engine, record_fees_accumulates) {
  auto fixture = covenant_fixture{"covenant_compliance_fees"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));

  ASSERT_TRUE(fixture.compliance().record_fees(id, 100).ok());
  ASSERT_TRUE(fixture.compliance().record_fees(id, 250).ok());
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).fees_generated, 350);

  EXPECT_EQ(fixture.compliance().record_fees(id, 0).code,
            error_code::invalid_amount);
  EXPECT_EQ(fixture.compliance().record_fees(id, -4).code,
            error_code::invalid_amount);
}

TEST(compliance_engine, record_fees_accumulates_past_int64) {
  auto fixture = covenant_fixture{"covenant_compliance_large_fees"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  auto large = amount_t{std::numeric_limits<int64_t>::max()};

  ASSERT_TRUE(fixture.compliance().record_fees(id, large).ok());
  ASSERT_TRUE(fixture.compliance().record_fees(id, large).ok());
  auto total = fixture.compliance().get_health_metrics(id).fees_generated;
  EXPECT_EQ(total, large * 2);
  EXPECT_GT(total, amount_t{std::numeric_limits<int64_t>::max()});

  auto overflow = fixture.compliance().record_fees(
      id, std::numeric_limits<amount_t>::max());
  EXPECT_EQ(overflow.code, error_code::invalid_amount);
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).fees_generated,
            large * 2);
  EXPECT_EQ(fixture.count_events("fees_recorded"), 2u);
}

TEST(compliance_engine, record_fees_requires_admin) {
  auto fixture = covenant_fixture{"covenant_compliance_fees_auth"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  fixture.require_explicit_auth();

  EXPECT_EQ(fixture.compliance().record_fees(id, 10).code,
            error_code::authorization_denied);
  fixture.authorize(covenant_fixture::admin());
  EXPECT_TRUE(fixture.compliance().record_fees(id, 10).ok());
}

TEST(compliance_engine, drawdown_override_is_display_only) {
  auto fixture = covenant_fixture{"covenant_compliance_override"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(30, 10));

  ASSERT_TRUE(fixture.compliance().record_drawdown(id, 50).ok());
  EXPECT_EQ(fixture.compliance().get_health_metrics(id).drawdown_percent, 50);
  EXPECT_EQ(fixture.compliance().calculate_compliance_score(id), 100u);
  EXPECT_TRUE(fixture.compliance().verify_compliance(id));
}

TEST(compliance_engine, health_metrics_merge_ledger_and_stored_state) {
  auto fixture = covenant_fixture{"covenant_compliance_metrics"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 2000, make_rules(30, 25));
  ASSERT_TRUE(fixture.ledger().update_value(id, 1500).ok());
  ASSERT_TRUE(fixture.compliance().record_fees(id, 40).ok());

  auto metrics = fixture.compliance().get_health_metrics(id);
  EXPECT_EQ(metrics.initial_value, 2000);
  EXPECT_EQ(metrics.current_value, 1500);
  EXPECT_EQ(metrics.drawdown_percent, 25);
  EXPECT_EQ(metrics.fees_generated, 40);
  EXPECT_EQ(metrics.compliance_score, 100u);
  EXPECT_EQ(metrics.last_attestation, 0u);
}
