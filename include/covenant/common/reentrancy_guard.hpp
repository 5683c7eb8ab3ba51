#pragma once

#include <optional>

namespace covenant::common {

/// Single held/not-held flag owned by one component instance.
///
/// `try_enter` hands back a scope whose destructor releases the flag, so every
/// exit path of a guarded operation (success, validation failure, downstream
/// error) leaves the guard free. Entering while a scope is alive fails.
class reentrancy_guard final {
 public:
  class scope final {
   public:
    scope(scope&& other) noexcept;
    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope& operator=(scope&&) = delete;
    ~scope();

   private:
    friend class reentrancy_guard;
    explicit scope(reentrancy_guard& guard);

    reentrancy_guard* guard_;
  };

  reentrancy_guard() = default;
  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

  /// Acquire the guard, or std::nullopt when it is already held.
  std::optional<scope> try_enter();

  bool held() const { return held_; }

 private:
  void release() noexcept;

  bool held_{false};
};

}  // namespace covenant::common
