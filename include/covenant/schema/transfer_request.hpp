#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct transfer_request;

template <>
struct transfer_request<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  token_id_t token_id{};
};

using transfer_request_t = transfer_request<1>;

}  // namespace covenant::schema
