#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: batch mode.
// atomic: the first failing item aborts the batch with nothing applied.
// best_effort: failing items are reported and skipped.
namespace covenant::schema {

enum class batch_mode_t : uint8_t { atomic = 0, best_effort = 1 };

inline constexpr auto kBatchModeMappings = std::array{
    std::pair<std::string_view, batch_mode_t>{"atomic", batch_mode_t::atomic},
    std::pair<std::string_view, batch_mode_t>{"best_effort",
                                              batch_mode_t::best_effort}};

template <>
inline std::optional<batch_mode_t> try_from_string<batch_mode_t>(
    const std::string_view value) {
  return from_string(value, kBatchModeMappings);
}

inline constexpr std::string_view to_string(const batch_mode_t value) {
  return to_string(value, kBatchModeMappings).value_or("unknown");
}

}  // namespace covenant::schema
