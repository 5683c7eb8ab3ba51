#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/commitment_rules.hpp>

namespace covenant::schema {

void encode(const commitment_rules<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.duration_days, encoder);
  encode(o.max_loss_percent, encoder);
  encode(static_cast<uint8_t>(o.commitment_type), encoder);
  encode(o.early_exit_penalty_percent, encoder);
  encode(o.min_fee_threshold, encoder);
  encode(o.grace_period_days, encoder);
}

void decode(commitment_rules<1>& o, ::scale::Decoder& decoder) {
  auto commitment_type = uint8_t{};
  decode(o.version, decoder);
  decode(o.duration_days, decoder);
  decode(o.max_loss_percent, decoder);
  decode(commitment_type, decoder);
  decode(o.early_exit_penalty_percent, decoder);
  decode(o.min_fee_threshold, decoder);
  decode(o.grace_period_days, decoder);
  o.commitment_type = static_cast<commitment_type_t>(commitment_type);
  if (!is_known(o.commitment_type)) {
    covenant::common::critical("unknown commitment type");
  }
}

}  // namespace covenant::schema
