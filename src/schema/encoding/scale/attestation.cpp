#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/attestation.hpp>

#include <utility>

namespace covenant::schema {

void encode(const attestation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.commitment_id, encoder);
  encode(static_cast<uint8_t>(o.type), encoder);
  encode(static_cast<uint32_t>(o.payload.size()), encoder);
  for (const auto& [key, value] : o.payload) {
    encode(key, encoder);
    encode(value, encoder);
  }
  encode(o.positive, encoder);
  encode(o.verifier, encoder);
  encode(o.timestamp, encoder);
}

void decode(attestation<1>& o, ::scale::Decoder& decoder) {
  auto type = uint8_t{};
  auto payload_size = uint32_t{};
  decode(o.version, decoder);
  decode(o.commitment_id, decoder);
  decode(type, decoder);
  decode(payload_size, decoder);
  o.payload.clear();
  for (auto i = uint32_t{0}; i < payload_size; ++i) {
    auto key = std::string{};
    auto value = std::string{};
    decode(key, decoder);
    decode(value, decoder);
    o.payload.emplace(std::move(key), std::move(value));
  }
  decode(o.positive, decoder);
  decode(o.verifier, decoder);
  decode(o.timestamp, decoder);
  o.type = static_cast<attestation_type_t>(type);
  if (!is_known(o.type)) {
    covenant::common::critical("unknown attestation type");
  }
}

}  // namespace covenant::schema
