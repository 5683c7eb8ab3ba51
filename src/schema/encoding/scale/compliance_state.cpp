#include <covenant/schema/encoding/scale/compliance_state.hpp>

namespace covenant::schema {

void encode(const compliance_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.commitment_id, encoder);
  encode(o.fees_generated, encoder);
  encode(o.compliance_score, encoder);
  encode(o.last_attestation, encoder);
  encode(o.attestation_count, encoder);
  encode(o.drawdown_override, encoder);
}

void decode(compliance_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.commitment_id, decoder);
  decode(o.fees_generated, decoder);
  decode(o.compliance_score, decoder);
  decode(o.last_attestation, decoder);
  decode(o.attestation_count, decoder);
  decode(o.drawdown_override, decoder);
}

}  // namespace covenant::schema
