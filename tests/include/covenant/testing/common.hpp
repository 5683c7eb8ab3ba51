#pragma once

#include <covenant/schema/commitment_rules.hpp>
#include <covenant/schema/commitment_type.hpp>
#include <covenant/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace covenant::testing {

inline covenant::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = covenant::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline covenant::schema::address_t make_address(const uint8_t seed) {
  auto address = covenant::schema::address_t{};
  address[0] = seed;
  return address;
}

inline covenant::schema::commitment_rules_t make_rules(
    const uint32_t duration_days = 30,
    const uint32_t max_loss_percent = 10,
    const uint32_t early_exit_penalty_percent = 5,
    const covenant::schema::commitment_type_t type =
        covenant::schema::commitment_type_t::balanced) {
  auto rules = covenant::schema::commitment_rules_t{};
  rules.duration_days = duration_days;
  rules.max_loss_percent = max_loss_percent;
  rules.commitment_type = type;
  rules.early_exit_penalty_percent = early_exit_penalty_percent;
  rules.min_fee_threshold = 100;
  rules.grace_period_days = 3;
  return rules;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace covenant::testing
