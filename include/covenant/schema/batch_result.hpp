#pragma once
#include <covenant/schema/batch_mode.hpp>
#include <covenant/schema/error_code.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace covenant::schema {

struct batch_failure final {
  std::size_t index{};
  error_code code{error_code::ok};
  std::string log;
};

struct batch_result final {
  batch_mode_t mode{batch_mode_t::atomic};
  std::size_t succeeded{};
  std::vector<batch_failure> failures;
  bool aborted{};
};

using batch_result_t = batch_result;

}  // namespace covenant::schema
