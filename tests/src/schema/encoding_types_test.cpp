#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/key/keys.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

namespace {

using encoder_t = covenant::schema::encoding::scale_encoder_t;

covenant::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = covenant::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

covenant::schema::commitment_t make_commitment() {
  auto commitment = covenant::schema::commitment_t{};
  commitment.commitment_id = make_hash(1);
  commitment.owner = make_hash(2);
  commitment.token_id = 9;
  commitment.rules.duration_days = 30;
  commitment.rules.max_loss_percent = 12;
  commitment.rules.commitment_type =
      covenant::schema::commitment_type_t::aggressive;
  commitment.rules.early_exit_penalty_percent = 4;
  commitment.rules.min_fee_threshold = 250;
  commitment.rules.grace_period_days = 2;
  commitment.amount = 10'000;
  commitment.asset = make_hash(3);
  commitment.created_at = 100;
  commitment.expires_at = 100 + (30 * covenant::schema::kSecondsPerDay);
  commitment.current_value = 9'500;
  return commitment;
}

}  // namespace

TEST(encoding_types, commitment_round_trips_every_status) {
  auto encoder = encoder_t{};
  auto statuses = std::vector<covenant::schema::commitment_status_t>{
      covenant::schema::active_status{},
      covenant::schema::settled_status{.settled_at = 777},
      covenant::schema::early_exit_status{.exited_at = 555, .penalty = 400}};

  for (const auto& status : statuses) {
    auto commitment = make_commitment();
    commitment.status = status;
    auto decoded = encoder.decode<covenant::schema::commitment_t>(
        encoder.encode(commitment));

    EXPECT_EQ(decoded.commitment_id, commitment.commitment_id);
    EXPECT_EQ(decoded.rules.commitment_type, commitment.rules.commitment_type);
    EXPECT_EQ(decoded.rules.min_fee_threshold, 250);
    EXPECT_EQ(decoded.expires_at, commitment.expires_at);
    EXPECT_EQ(decoded.current_value, 9'500);
    ASSERT_EQ(decoded.status.index(), status.index());
  }

  auto exited = make_commitment();
  exited.status = covenant::schema::early_exit_status{.exited_at = 5,
                                                      .penalty = 400};
  auto decoded =
      encoder.decode<covenant::schema::commitment_t>(encoder.encode(exited));
  auto* status = std::get_if<covenant::schema::early_exit_status>(&decoded.status);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->exited_at, 5u);
  EXPECT_EQ(status->penalty, 400);
}

TEST(encoding_types, amounts_beyond_int64_round_trip) {
  auto encoder = encoder_t{};
  auto large = covenant::schema::amount_t{std::numeric_limits<int64_t>::max()} *
               1000;
  auto commitment = make_commitment();
  commitment.amount = large;
  commitment.current_value = -large;
  commitment.status =
      covenant::schema::early_exit_status{.exited_at = 9, .penalty = -large};

  auto decoded =
      encoder.decode<covenant::schema::commitment_t>(encoder.encode(commitment));
  EXPECT_EQ(decoded.amount, large);
  EXPECT_EQ(decoded.current_value, -large);
  auto* status = std::get_if<covenant::schema::early_exit_status>(&decoded.status);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->penalty, -large);

  auto extreme = make_commitment();
  extreme.amount = std::numeric_limits<covenant::schema::amount_t>::max();
  EXPECT_EQ(
      encoder.decode<covenant::schema::commitment_t>(encoder.encode(extreme))
          .amount,
      extreme.amount);
}

TEST(encoding_types, amount_layout_is_sign_then_magnitude) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(covenant::schema::commitment_status_t{
      covenant::schema::early_exit_status{.exited_at = 0, .penalty = -2}});

  // status index (1 byte) and exited_at (8 bytes) precede the penalty.
  constexpr auto kPenaltyOffset = std::size_t{1 + 8};
  ASSERT_EQ(bytes.size(), kPenaltyOffset + 17);
  EXPECT_EQ(bytes[kPenaltyOffset], 0x01);
  EXPECT_EQ(bytes[kPenaltyOffset + 1], 0x02);
  for (auto i = kPenaltyOffset + 2; i < bytes.size(); ++i) {
    EXPECT_EQ(bytes[i], 0x00);
  }

  bytes[kPenaltyOffset] = 0x05;
  EXPECT_DEATH(encoder.decode<covenant::schema::commitment_status_t>(bytes),
               "");
}

TEST(encoding_types, status_layout_is_index_then_fields) {
  auto encoder = encoder_t{};
  auto active = encoder.encode(
      covenant::schema::commitment_status_t{covenant::schema::active_status{}});
  EXPECT_EQ(active, (covenant::schema::bytes_t{0x00}));

  auto settled = encoder.encode(covenant::schema::commitment_status_t{
      covenant::schema::settled_status{.settled_at = 1}});
  ASSERT_EQ(settled.size(), 9u);
  EXPECT_EQ(settled[0], 0x01);
  EXPECT_EQ(settled[1], 0x01);
}

TEST(encoding_types, truncated_record_fails_to_decode) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<covenant::schema::ownership_record_t>(
      covenant::schema::bytes_t{0x01});
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, unknown_attestation_type_is_fatal) {
  auto encoder = encoder_t{};
  auto attestation = covenant::schema::attestation_t{};
  attestation.commitment_id = make_hash(4);
  attestation.type = covenant::schema::attestation_type_t::drawdown;
  auto bytes = encoder.encode(attestation);

  // version (2 bytes) and commitment id (32 bytes) precede the type byte.
  constexpr auto kTypeOffset = std::size_t{2 + 32};
  ASSERT_GT(bytes.size(), kTypeOffset);
  ASSERT_EQ(bytes[kTypeOffset], 3);
  bytes[kTypeOffset] = 9;

  EXPECT_FALSE(covenant::schema::is_known(
      static_cast<covenant::schema::attestation_type_t>(9)));
  EXPECT_DEATH(encoder.decode<covenant::schema::attestation_t>(bytes), "");
}

TEST(encoding_types, ownership_record_keeps_metadata_snapshot) {
  auto encoder = encoder_t{};
  auto record = covenant::schema::ownership_record_t{};
  record.token_id = 3;
  record.owner = make_hash(8);
  record.metadata.commitment_id = make_hash(9);
  record.metadata.duration_days = 7;
  record.metadata.initial_amount = 42;
  record.is_active = false;
  record.early_exit_penalty = 6;

  auto decoded = encoder.decode<covenant::schema::ownership_record_t>(
      encoder.encode(record));
  EXPECT_EQ(decoded.token_id, 3u);
  EXPECT_EQ(decoded.owner, record.owner);
  EXPECT_EQ(decoded.metadata.commitment_id, record.metadata.commitment_id);
  EXPECT_EQ(decoded.metadata.initial_amount, 42);
  EXPECT_FALSE(decoded.is_active);
  EXPECT_EQ(decoded.early_exit_penalty, 6);
}

TEST(encoding_types, attestation_and_compliance_state_round_trip) {
  auto encoder = encoder_t{};
  auto attestation = covenant::schema::attestation_t{};
  attestation.commitment_id = make_hash(4);
  attestation.type = covenant::schema::attestation_type_t::violation;
  attestation.payload = {{"severity", "high"}, {"source", "monitor"}};
  attestation.positive = false;
  attestation.verifier = make_hash(5);
  attestation.timestamp = 1234;

  auto decoded_attestation = encoder.decode<covenant::schema::attestation_t>(
      encoder.encode(attestation));
  EXPECT_EQ(decoded_attestation.type, attestation.type);
  EXPECT_EQ(decoded_attestation.payload, attestation.payload);
  EXPECT_EQ(decoded_attestation.verifier, attestation.verifier);

  auto state = covenant::schema::compliance_state_t{};
  state.commitment_id = make_hash(4);
  state.fees_generated = 99;
  state.compliance_score = 61;
  state.attestation_count = 3;
  auto without_override =
      encoder.decode<covenant::schema::compliance_state_t>(encoder.encode(state));
  EXPECT_FALSE(without_override.drawdown_override.has_value());
  EXPECT_EQ(without_override.compliance_score, 61u);

  state.drawdown_override = 15;
  auto with_override =
      encoder.decode<covenant::schema::compliance_state_t>(encoder.encode(state));
  ASSERT_TRUE(with_override.drawdown_override.has_value());
  EXPECT_EQ(*with_override.drawdown_override, 15);
}

TEST(encoding_types, attestation_keys_sort_by_sequence) {
  auto encoder = encoder_t{};
  auto id = make_hash(20);
  auto prefix = covenant::schema::key::make_attestation_prefix_key(encoder, id);
  auto keys = std::vector<covenant::schema::bytes_t>{};
  for (const auto sequence : {0ull, 1ull, 255ull, 256ull, 70'000ull}) {
    keys.push_back(
        covenant::schema::key::make_attestation_key(encoder, id, sequence));
  }
  EXPECT_TRUE(std::is_sorted(std::begin(keys), std::end(keys)));
  for (const auto& key : keys) {
    EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                           std::begin(key)));
  }
}

TEST(encoding_types, component_keyspaces_are_distinct) {
  const auto& keyspaces = covenant::schema::key::kComponentKeyspaces;
  for (std::size_t i = 0; i < keyspaces.size(); ++i) {
    for (std::size_t j = i + 1; j < keyspaces.size(); ++j) {
      EXPECT_NE(keyspaces[i], keyspaces[j]);
    }
  }
}
