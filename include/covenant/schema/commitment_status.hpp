#pragma once
#include <covenant/schema/primitives.hpp>

#include <string_view>
#include <variant>

// Schema type: commitment status.
// Lifecycle: active is the only initial state; settled and early_exit are
// terminal and carry the facts recorded at the transition.
namespace covenant::schema {

struct active_status final {};

struct settled_status final {
  timestamp_seconds_t settled_at{};
};

struct early_exit_status final {
  timestamp_seconds_t exited_at{};
  amount_t penalty{};
};

using commitment_status_t =
    std::variant<active_status, settled_status, early_exit_status>;

inline std::string_view to_string(const commitment_status_t& status) {
  return std::visit(
      overloaded{[](const active_status&) { return std::string_view{"active"}; },
                 [](const settled_status&) {
                   return std::string_view{"settled"};
                 },
                 [](const early_exit_status&) {
                   return std::string_view{"early_exit"};
                 }},
      status);
}

inline bool is_active(const commitment_status_t& status) {
  return std::holds_alternative<active_status>(status);
}

}  // namespace covenant::schema
