#pragma once
#include <covenant/schema/token_metadata.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const token_metadata<1>& o, ::scale::Encoder& encoder);
void decode(token_metadata<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
