#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/commitment_status.hpp>

namespace covenant::schema {

// Encoded as a one byte alternative index followed by the alternative's
// fields, matching the codec's own variant layout.
void encode(const commitment_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o.index()), encoder);
  std::visit(overloaded{[&](const active_status&) {},
                        [&](const settled_status& value) {
                          encode(value.settled_at, encoder);
                        },
                        [&](const early_exit_status& value) {
                          encode(value.exited_at, encoder);
                          encode(value.penalty, encoder);
                        }},
             o);
}

void decode(commitment_status_t& o, ::scale::Decoder& decoder) {
  auto index = uint8_t{};
  decode(index, decoder);
  switch (index) {
    case 0:
      o = active_status{};
      return;
    case 1: {
      auto value = settled_status{};
      decode(value.settled_at, decoder);
      o = value;
      return;
    }
    case 2: {
      auto value = early_exit_status{};
      decode(value.exited_at, decoder);
      decode(value.penalty, decoder);
      o = value;
      return;
    }
    default:
      covenant::common::critical("unknown commitment status index");
  }
}

}  // namespace covenant::schema
