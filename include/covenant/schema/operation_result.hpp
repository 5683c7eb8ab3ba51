#pragma once

#include <covenant/schema/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// Schema type: operation result.
// Envelope returned by every ledger, registry and compliance operation:
// outcome code, human-readable log, the component codespace and, on success,
// the produced value.
namespace covenant::schema {

template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
  explicit operator bool() const { return ok(); }

  const T& operator*() const { return *value; }
  const T* operator->() const { return &*value; }
};

using status_t = operation_result<std::monostate>;

template <typename T>
operation_result<T> make_success(T value) {
  auto result = operation_result<T>{};
  result.value = std::move(value);
  return result;
}

inline status_t make_success() {
  return make_success(std::monostate{});
}

template <typename T = std::monostate>
operation_result<T> make_failure(const error_code code,
                                 const std::string_view codespace,
                                 std::string log) {
  auto result = operation_result<T>{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

/// Re-type a failed result so it can be returned from a caller with a
/// different value type.
template <typename T, typename U>
operation_result<T> propagate_failure(const operation_result<U>& failure) {
  auto result = operation_result<T>{};
  result.code = failure.code;
  result.log = failure.log;
  result.codespace = failure.codespace;
  return result;
}

}  // namespace covenant::schema
