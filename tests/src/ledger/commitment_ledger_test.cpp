#include <covenant/ledger/commitment_ledger.hpp>
#include <covenant/testing/covenant_fixture.hpp>
#include <gtest/gtest.h>

#include <variant>

namespace {

using covenant::schema::error_code;
using covenant::testing::covenant_fixture;
using covenant::testing::make_address;
using covenant::testing::make_hash;
using covenant::testing::make_rules;

}  // namespace

TEST(commitment_ledger, operations_before_initialize_fail) {
  auto fixture = covenant_fixture{"covenant_ledger_uninitialized"};
  auto created = fixture.ledger().create_commitment(
      make_address(1), 1000, make_hash(90), make_rules());
  EXPECT_EQ(created.code, error_code::not_initialized);
  EXPECT_EQ(created.codespace, "covenant.ledger");
  EXPECT_EQ(fixture.ledger().get_total_commitments(), 0u);
}

TEST(commitment_ledger, initialize_is_one_shot) {
  auto fixture = covenant_fixture{"covenant_ledger_init"};
  ASSERT_TRUE(fixture.initialize());
  auto again = fixture.ledger().initialize(make_address(7));
  EXPECT_EQ(again.code, error_code::already_initialized);
  ASSERT_TRUE(fixture.ledger().get_admin().has_value());
  EXPECT_EQ(*fixture.ledger().get_admin(), covenant_fixture::admin());
}

TEST(commitment_ledger, create_sets_active_status_and_expiry) {
  auto fixture = covenant_fixture{"covenant_ledger_create"};
  ASSERT_TRUE(fixture.initialize());
  auto owner = make_address(1);

  for (const auto duration : {1u, 30u, 365u}) {
    auto created = fixture.ledger().create_commitment(
        owner, 500, make_hash(90), make_rules(duration));
    ASSERT_TRUE(created.ok()) << created.log;

    auto commitment = fixture.ledger().get_commitment(*created);
    ASSERT_TRUE(commitment.ok());
    EXPECT_TRUE(std::holds_alternative<covenant::schema::active_status>(
        commitment->status));
    EXPECT_EQ(commitment->created_at, fixture.now());
    EXPECT_EQ(commitment->expires_at,
              commitment->created_at +
                  duration * covenant::schema::kSecondsPerDay);
    EXPECT_EQ(commitment->amount, 500);
    EXPECT_EQ(commitment->current_value, 500);
    EXPECT_EQ(commitment->owner, owner);
  }

  EXPECT_EQ(fixture.ledger().get_total_commitments(), 3u);
  EXPECT_EQ(fixture.ledger().get_owner_commitments(owner).size(), 3u);
}

TEST(commitment_ledger, create_mints_matching_token) {
  auto fixture = covenant_fixture{"covenant_ledger_mint"};
  ASSERT_TRUE(fixture.initialize());
  auto owner = make_address(1);
  auto id = fixture.create(owner, 2500, make_rules(10, 15));

  auto commitment = fixture.ledger().get_commitment(id);
  ASSERT_TRUE(commitment.ok());
  EXPECT_EQ(commitment->token_id, 1u);

  auto metadata = fixture.registry().get_metadata(commitment->token_id);
  ASSERT_TRUE(metadata.ok());
  EXPECT_EQ(metadata->commitment_id, id);
  EXPECT_EQ(metadata->initial_amount, 2500);
  EXPECT_EQ(metadata->max_loss_percent, 15u);
  EXPECT_EQ(metadata->expires_at, commitment->expires_at);
  EXPECT_EQ(*fixture.registry().owner_of(commitment->token_id), owner);
  EXPECT_EQ(fixture.count_events("commitment_created"), 1u);
  EXPECT_EQ(fixture.count_events("mint"), 1u);
}

TEST(commitment_ledger, commitment_ids_are_unique) {
  auto fixture = covenant_fixture{"covenant_ledger_ids"};
  ASSERT_TRUE(fixture.initialize());
  auto first = fixture.create(make_address(1));
  auto second = fixture.create(make_address(1));
  EXPECT_NE(first, second);
  EXPECT_NE(first, covenant::schema::make_zero_hash());
}

TEST(commitment_ledger, create_rejects_invalid_terms) {
  auto fixture = covenant_fixture{"covenant_ledger_invalid"};
  ASSERT_TRUE(fixture.initialize());
  auto owner = make_address(1);
  auto asset = make_hash(90);

  EXPECT_EQ(fixture.ledger().create_commitment(owner, 0, asset, make_rules()).code,
            error_code::invalid_amount);
  EXPECT_EQ(
      fixture.ledger().create_commitment(owner, -5, asset, make_rules()).code,
      error_code::invalid_amount);
  EXPECT_EQ(
      fixture.ledger().create_commitment(owner, 100, asset, make_rules(0)).code,
      error_code::invalid_duration);
  EXPECT_EQ(fixture.ledger()
                .create_commitment(owner, 100, asset, make_rules(30, 101))
                .code,
            error_code::invalid_max_loss);
  EXPECT_EQ(fixture.ledger()
                .create_commitment(owner, 100, asset, make_rules(30, 10, 101))
                .code,
            error_code::invalid_penalty);

  auto unknown_type = make_rules();
  unknown_type.commitment_type =
      static_cast<covenant::schema::commitment_type_t>(9);
  EXPECT_EQ(
      fixture.ledger().create_commitment(owner, 100, asset, unknown_type).code,
      error_code::invalid_commitment_type);

  EXPECT_EQ(fixture.ledger().get_total_commitments(), 0u);
  EXPECT_EQ(fixture.registry().total_supply(), 0u);
}

TEST(commitment_ledger, create_requires_owner_authorization) {
  auto fixture = covenant_fixture{"covenant_ledger_create_auth"};
  ASSERT_TRUE(fixture.initialize());
  fixture.require_explicit_auth();
  fixture.authorize(covenant_fixture::ledger_address());

  auto owner = make_address(1);
  auto denied = fixture.ledger().create_commitment(owner, 100, make_hash(90),
                                                   make_rules());
  EXPECT_EQ(denied.code, error_code::authorization_denied);

  fixture.authorize(owner);
  EXPECT_TRUE(fixture.ledger()
                  .create_commitment(owner, 100, make_hash(90), make_rules())
                  .ok());
}

TEST(commitment_ledger, update_value_overwrites_current_value) {
  auto fixture = covenant_fixture{"covenant_ledger_update"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));

  ASSERT_TRUE(fixture.ledger().update_value(id, 700).ok());
  auto commitment = fixture.ledger().get_commitment(id);
  EXPECT_EQ(commitment->current_value, 700);
  EXPECT_TRUE(covenant::schema::is_active(commitment->status));

  EXPECT_EQ(fixture.ledger().update_value(id, -1).code,
            error_code::invalid_amount);
  EXPECT_EQ(fixture.ledger().update_value(make_hash(3), 10).code,
            error_code::commitment_not_found);
}

TEST(commitment_ledger, update_value_requires_admin) {
  auto fixture = covenant_fixture{"covenant_ledger_update_auth"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));
  fixture.require_explicit_auth();
  fixture.authorize(make_address(1));

  EXPECT_EQ(fixture.ledger().update_value(id, 10).code,
            error_code::authorization_denied);
  fixture.authorize(covenant_fixture::admin());
  EXPECT_TRUE(fixture.ledger().update_value(id, 10).ok());
}

TEST(commitment_ledger, settle_before_expiry_fails) {
  auto fixture = covenant_fixture{"covenant_ledger_settle_early"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(30));

  fixture.advance_days(29);
  EXPECT_EQ(fixture.ledger().settle(id).code, error_code::not_expired);
  EXPECT_TRUE(
      covenant::schema::is_active(fixture.ledger().get_commitment(id)->status));
}

TEST(commitment_ledger, settle_after_expiry_is_terminal) {
  auto fixture = covenant_fixture{"covenant_ledger_settle"};
  ASSERT_TRUE(fixture.initialize());
  auto owner = make_address(1);
  auto id = fixture.create(owner, 1000, make_rules(30));

  fixture.advance_days(30);
  ASSERT_TRUE(fixture.ledger().settle(id).ok());

  auto commitment = fixture.ledger().get_commitment(id);
  auto* settled =
      std::get_if<covenant::schema::settled_status>(&commitment->status);
  ASSERT_NE(settled, nullptr);
  EXPECT_EQ(settled->settled_at, fixture.now());
  EXPECT_FALSE(fixture.registry().is_active(commitment->token_id));

  EXPECT_EQ(fixture.ledger().settle(id).code, error_code::already_settled);
  EXPECT_FALSE(fixture.ledger().early_exit(id, owner).ok());
  EXPECT_EQ(fixture.ledger().early_exit(id, owner).code,
            error_code::already_settled);
}

TEST(commitment_ledger, early_exit_returns_penalty_and_is_terminal) {
  auto fixture = covenant_fixture{"covenant_ledger_exit"};
  ASSERT_TRUE(fixture.initialize());
  auto owner = make_address(1);
  auto id = fixture.create(owner, 1000, make_rules(30, 10, 5));

  auto exited = fixture.ledger().early_exit(id, owner);
  ASSERT_TRUE(exited.ok()) << exited.log;
  EXPECT_EQ(*exited, 50);

  auto commitment = fixture.ledger().get_commitment(id);
  auto* status =
      std::get_if<covenant::schema::early_exit_status>(&commitment->status);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->penalty, 50);

  auto token = fixture.registry().get_token(commitment->token_id);
  ASSERT_TRUE(token.ok());
  EXPECT_FALSE(token->is_active);
  EXPECT_EQ(token->early_exit_penalty, 50);

  EXPECT_EQ(fixture.ledger().early_exit(id, owner).code,
            error_code::invalid_status_transition);
  fixture.advance_days(31);
  EXPECT_EQ(fixture.ledger().settle(id).code,
            error_code::invalid_status_transition);
}

TEST(commitment_ledger, early_exit_requires_owner) {
  auto fixture = covenant_fixture{"covenant_ledger_exit_owner"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1));

  EXPECT_EQ(fixture.ledger().early_exit(id, make_address(2)).code,
            error_code::not_owner);
  EXPECT_EQ(fixture.ledger().early_exit(make_hash(4), make_address(1)).code,
            error_code::commitment_not_found);
}

TEST(commitment_ledger, update_value_allowed_after_settlement) {
  auto fixture = covenant_fixture{"covenant_ledger_update_settled"};
  ASSERT_TRUE(fixture.initialize());
  auto id = fixture.create(make_address(1), 1000, make_rules(1));
  fixture.advance_days(1);
  ASSERT_TRUE(fixture.ledger().settle(id).ok());

  EXPECT_TRUE(fixture.ledger().update_value(id, 1200).ok());
  EXPECT_EQ(fixture.ledger().get_commitment(id)->current_value, 1200);
}

TEST(commitment_ledger, get_commitment_unknown_fails) {
  auto fixture = covenant_fixture{"covenant_ledger_unknown"};
  ASSERT_TRUE(fixture.initialize());
  auto missing = fixture.ledger().get_commitment(make_hash(5));
  EXPECT_EQ(missing.code, error_code::commitment_not_found);
  EXPECT_FALSE(missing.value.has_value());
}
