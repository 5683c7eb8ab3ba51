#pragma once
#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace covenant::blake3 {

covenant::schema::hash32_t hash(const std::string_view& str);
covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes);

}  // namespace covenant::blake3
