#include <spdlog/spdlog.h>
#include <covenant/common/batch.hpp>
#include <string>

namespace covenant::common {

covenant::schema::status_t enforce_batch_limits(const batch_limits& limits,
                                                const std::size_t size,
                                                const std::string_view context) {
  if (size > limits.max_batch_size) {
    spdlog::warn("{}: batch of {} exceeds limit {}", context, size,
                 limits.max_batch_size);
    return covenant::schema::make_failure(
        covenant::schema::error_code::batch_too_large, context,
        "batch size " + std::to_string(size) + " exceeds limit " +
            std::to_string(limits.max_batch_size));
  }
  return covenant::schema::make_success();
}

}  // namespace covenant::common
