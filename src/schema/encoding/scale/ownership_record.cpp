#include <covenant/schema/encoding/scale/ownership_record.hpp>
#include <covenant/schema/encoding/scale/token_metadata.hpp>

namespace covenant::schema {

void encode(const ownership_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token_id, encoder);
  encode(o.owner, encoder);
  encode(o.metadata, encoder);
  encode(o.is_active, encoder);
  encode(o.early_exit_penalty, encoder);
}

void decode(ownership_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token_id, decoder);
  decode(o.owner, decoder);
  decode(o.metadata, decoder);
  decode(o.is_active, decoder);
  decode(o.early_exit_penalty, decoder);
}

}  // namespace covenant::schema
