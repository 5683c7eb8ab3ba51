#pragma once
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/encoder.hpp>
#include <covenant/schema/encoding/scale/attestation.hpp>
#include <covenant/schema/encoding/scale/commitment.hpp>
#include <covenant/schema/encoding/scale/commitment_rules.hpp>
#include <covenant/schema/encoding/scale/commitment_status.hpp>
#include <covenant/schema/encoding/scale/compliance_state.hpp>
#include <covenant/schema/encoding/scale/ownership_record.hpp>
#include <covenant/schema/encoding/scale/token_metadata.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace covenant::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  covenant::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, covenant::schema::bytes_t& out);

  template <typename T>
  T decode(const covenant::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const covenant::schema::bytes_view_t& bytes);
};

template <typename T>
covenant::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    covenant::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        covenant::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const covenant::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    covenant::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const covenant::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace covenant::schema::encoding
