#pragma once

#include <covenant/schema/batch_mode.hpp>
#include <covenant/schema/batch_result.hpp>
#include <covenant/schema/operation_result.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace covenant::common {

inline constexpr std::size_t kDefaultMaxBatchSize = 50;

struct batch_limits final {
  std::size_t max_batch_size{kDefaultMaxBatchSize};
};

/// Reject batches above the configured ceiling before any item is looked at.
covenant::schema::status_t enforce_batch_limits(const batch_limits& limits,
                                                std::size_t size,
                                                std::string_view context);

/// Run `apply(index, item)` over `items` under `mode`.
///
/// `apply` must leave no trace when it fails. In atomic mode the first failure
/// stops the run, the result is marked aborted and reports zero successes so
/// the caller discards whatever it staged. In best-effort mode every failure
/// is recorded with its index and the run continues.
template <typename Item, typename Apply>
covenant::schema::batch_result_t run_batch(const std::vector<Item>& items,
                                           covenant::schema::batch_mode_t mode,
                                           Apply&& apply) {
  auto result = covenant::schema::batch_result_t{};
  result.mode = mode;
  for (std::size_t index = 0; index < items.size(); ++index) {
    auto status = apply(index, items[index]);
    if (status.ok()) {
      ++result.succeeded;
      continue;
    }
    result.failures.push_back(covenant::schema::batch_failure{
        .index = index, .code = status.code, .log = status.log});
    if (mode == covenant::schema::batch_mode_t::atomic) {
      result.aborted = true;
      result.succeeded = 0;
      break;
    }
  }
  return result;
}

}  // namespace covenant::common
