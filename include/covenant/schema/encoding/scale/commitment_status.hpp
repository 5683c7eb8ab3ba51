#pragma once
#include <covenant/schema/commitment_status.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const commitment_status_t& o, ::scale::Encoder& encoder);
void decode(commitment_status_t& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
