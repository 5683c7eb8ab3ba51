#pragma once
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/token_metadata.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct ownership_record;

template <>
struct ownership_record<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t owner{};
  token_metadata_t metadata{};
  bool is_active{true};
  amount_t early_exit_penalty{};
};

using ownership_record_t = ownership_record<1>;

}  // namespace covenant::schema
