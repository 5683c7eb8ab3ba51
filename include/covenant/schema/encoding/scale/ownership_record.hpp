#pragma once
#include <covenant/schema/ownership_record.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const ownership_record<1>& o, ::scale::Encoder& encoder);
void decode(ownership_record<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
