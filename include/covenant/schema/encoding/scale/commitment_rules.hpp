#pragma once
#include <covenant/schema/commitment_rules.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared next to the schema types so the codec finds them by
// argument-dependent lookup.
namespace covenant::schema {

void encode(const commitment_rules<1>& o, ::scale::Encoder& encoder);
void decode(commitment_rules<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
