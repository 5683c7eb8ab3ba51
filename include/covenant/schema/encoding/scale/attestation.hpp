#pragma once
#include <covenant/schema/attestation.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const attestation<1>& o, ::scale::Encoder& encoder);
void decode(attestation<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
