#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/primitives.hpp>

#include <limits>

namespace covenant::schema {

namespace {

using magnitude_t = boost::multiprecision::uint128_t;

}  // namespace

void encode(const amount_t& o, ::scale::Encoder& encoder) {
  auto magnitude = static_cast<magnitude_t>(abs(o));
  encode(static_cast<uint8_t>(o < 0 ? 1 : 0), encoder);
  encode(static_cast<uint64_t>(magnitude & std::numeric_limits<uint64_t>::max()),
         encoder);
  encode(static_cast<uint64_t>(magnitude >> 64), encoder);
}

void decode(amount_t& o, ::scale::Decoder& decoder) {
  auto negative = uint8_t{};
  auto low = uint64_t{};
  auto high = uint64_t{};
  decode(negative, decoder);
  decode(low, decoder);
  decode(high, decoder);
  if (negative > 1) {
    covenant::common::critical("invalid amount sign byte");
  }
  auto magnitude = (magnitude_t{high} << 64) | magnitude_t{low};
  o = static_cast<amount_t>(magnitude);
  if (negative == 1) {
    o = -o;
  }
}

}  // namespace covenant::schema
