#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/token_metadata.hpp>

namespace covenant::schema {

void encode(const token_metadata<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.commitment_id, encoder);
  encode(o.duration_days, encoder);
  encode(o.max_loss_percent, encoder);
  encode(static_cast<uint8_t>(o.commitment_type), encoder);
  encode(o.created_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.initial_amount, encoder);
  encode(o.asset, encoder);
}

void decode(token_metadata<1>& o, ::scale::Decoder& decoder) {
  auto commitment_type = uint8_t{};
  decode(o.version, decoder);
  decode(o.commitment_id, decoder);
  decode(o.duration_days, decoder);
  decode(o.max_loss_percent, decoder);
  decode(commitment_type, decoder);
  decode(o.created_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.initial_amount, decoder);
  decode(o.asset, decoder);
  o.commitment_type = static_cast<commitment_type_t>(commitment_type);
  if (!is_known(o.commitment_type)) {
    covenant::common::critical("unknown commitment type");
  }
}

}  // namespace covenant::schema
