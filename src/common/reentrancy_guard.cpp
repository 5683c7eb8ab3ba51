#include <covenant/common/reentrancy_guard.hpp>

namespace covenant::common {

reentrancy_guard::scope::scope(reentrancy_guard& guard) : guard_{&guard} {
  guard_->held_ = true;
}

reentrancy_guard::scope::scope(scope&& other) noexcept : guard_{other.guard_} {
  other.guard_ = nullptr;
}

reentrancy_guard::scope::~scope() {
  if (guard_ != nullptr) {
    guard_->release();
  }
}

std::optional<reentrancy_guard::scope> reentrancy_guard::try_enter() {
  if (held_) {
    return std::nullopt;
  }
  return std::optional<scope>{scope{*this}};
}

void reentrancy_guard::release() noexcept {
  held_ = false;
}

}  // namespace covenant::common
