#pragma once
#include <covenant/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

/// Sign byte (0 or 1) followed by the 128-bit magnitude as two little-endian
/// 64-bit halves, low half first.
void encode(const amount_t& o, ::scale::Encoder& encoder);
void decode(amount_t& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
