#include <covenant/schema/encoding/scale/commitment.hpp>
#include <covenant/schema/encoding/scale/commitment_rules.hpp>
#include <covenant/schema/encoding/scale/commitment_status.hpp>

namespace covenant::schema {

void encode(const commitment<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.commitment_id, encoder);
  encode(o.owner, encoder);
  encode(o.token_id, encoder);
  encode(o.rules, encoder);
  encode(o.amount, encoder);
  encode(o.asset, encoder);
  encode(o.created_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.current_value, encoder);
  encode(o.status, encoder);
}

void decode(commitment<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.commitment_id, decoder);
  decode(o.owner, decoder);
  decode(o.token_id, decoder);
  decode(o.rules, decoder);
  decode(o.amount, decoder);
  decode(o.asset, decoder);
  decode(o.created_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.current_value, decoder);
  decode(o.status, decoder);
}

}  // namespace covenant::schema
