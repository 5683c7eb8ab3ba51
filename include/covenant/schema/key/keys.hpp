#pragma once

#include <boost/endian/buffers.hpp>
#include <covenant/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <iterator>
#include <string_view>

// Schema key type: component keys.
// Each component owns its own keyspace. INSTANCE keys hold per-component
// singletons (admin, counters); STATE keys hold per-entity records.
namespace covenant::schema::key {

inline constexpr std::string_view kLedgerAdminKey{
    "SYS|LEDGER|INSTANCE|ADMIN"};
inline constexpr std::string_view kLedgerCounterKey{
    "SYS|LEDGER|INSTANCE|COMMITMENT_COUNTER"};
inline constexpr std::string_view kCommitmentKeyPrefix{
    "SYS|LEDGER|STATE|COMMITMENT|"};
inline constexpr std::string_view kOwnerCommitmentsKeyPrefix{
    "SYS|LEDGER|STATE|OWNER_COMMITMENTS|"};

inline constexpr std::string_view kRegistryAdminKey{
    "SYS|REGISTRY|INSTANCE|ADMIN"};
inline constexpr std::string_view kRegistryTokenCounterKey{
    "SYS|REGISTRY|INSTANCE|TOKEN_COUNTER"};
inline constexpr std::string_view kRegistryTokenIdsKey{
    "SYS|REGISTRY|INSTANCE|TOKEN_IDS"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|REGISTRY|STATE|TOKEN|"};
inline constexpr std::string_view kBalanceKeyPrefix{
    "SYS|REGISTRY|STATE|BALANCE|"};
inline constexpr std::string_view kOwnerTokensKeyPrefix{
    "SYS|REGISTRY|STATE|OWNER_TOKENS|"};

inline constexpr std::string_view kComplianceAdminKey{
    "SYS|COMPLIANCE|INSTANCE|ADMIN"};
inline constexpr std::string_view kComplianceStateKeyPrefix{
    "SYS|COMPLIANCE|STATE|METRICS|"};
inline constexpr std::string_view kAttestationKeyPrefix{
    "SYS|COMPLIANCE|STATE|ATTESTATION|"};

inline const std::array<std::string_view, 13> kComponentKeyspaces{
    kLedgerAdminKey,
    kLedgerCounterKey,
    kCommitmentKeyPrefix,
    kOwnerCommitmentsKeyPrefix,
    kRegistryAdminKey,
    kRegistryTokenCounterKey,
    kRegistryTokenIdsKey,
    kTokenKeyPrefix,
    kBalanceKeyPrefix,
    kOwnerTokensKeyPrefix,
    kComplianceAdminKey,
    kComplianceStateKeyPrefix,
    kAttestationKeyPrefix};

template <typename Encoder, typename T>
covenant::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
covenant::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
covenant::schema::bytes_t make_commitment_key(
    Encoder& encoder,
    const covenant::schema::commitment_id_t& commitment_id) {
  return make_prefixed_key(encoder, kCommitmentKeyPrefix, commitment_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_owner_commitments_key(
    Encoder& encoder,
    const covenant::schema::address_t& owner) {
  return make_prefixed_key(encoder, kOwnerCommitmentsKeyPrefix, owner);
}

template <typename Encoder>
covenant::schema::bytes_t make_token_key(
    Encoder& encoder,
    const covenant::schema::token_id_t token_id) {
  return make_prefixed_key(encoder, kTokenKeyPrefix, token_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const covenant::schema::address_t& owner) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, owner);
}

template <typename Encoder>
covenant::schema::bytes_t make_owner_tokens_key(
    Encoder& encoder,
    const covenant::schema::address_t& owner) {
  return make_prefixed_key(encoder, kOwnerTokensKeyPrefix, owner);
}

template <typename Encoder>
covenant::schema::bytes_t make_compliance_state_key(
    Encoder& encoder,
    const covenant::schema::commitment_id_t& commitment_id) {
  return make_prefixed_key(encoder, kComplianceStateKeyPrefix, commitment_id);
}

template <typename Encoder>
covenant::schema::bytes_t make_attestation_prefix_key(
    Encoder& encoder,
    const covenant::schema::commitment_id_t& commitment_id) {
  return make_prefixed_key(encoder, kAttestationKeyPrefix, commitment_id);
}

/// The sequence suffix is big-endian so a prefix scan returns attestations in
/// the order they were recorded.
template <typename Encoder>
covenant::schema::bytes_t make_attestation_key(
    Encoder& encoder,
    const covenant::schema::commitment_id_t& commitment_id,
    const uint64_t sequence) {
  auto key = make_attestation_prefix_key(encoder, commitment_id);
  auto suffix = boost::endian::big_uint64_buf_t{sequence};
  key.insert(std::end(key), suffix.data(), suffix.data() + sizeof(uint64_t));
  return key;
}

}  // namespace covenant::schema::key
