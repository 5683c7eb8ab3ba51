#pragma once
#include <covenant/schema/compliance_state.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const compliance_state<1>& o, ::scale::Encoder& encoder);
void decode(compliance_state<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
