#pragma once
#include <covenant/schema/commitment.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const commitment<1>& o, ::scale::Encoder& encoder);
void decode(commitment<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
