#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <utility>

namespace certvault {

// Cancellation and deadline carried through every storage call. A
// default-constructed Context never expires.
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  Context() = default;
  explicit Context(std::stop_token stop_token,
                   std::optional<Clock::time_point> deadline = std::nullopt)
      : stop_token_(std::move(stop_token)), deadline_(deadline) {}

  static Context WithTimeout(std::chrono::milliseconds timeout,
                             std::stop_token stop_token = {});

  const std::stop_token& stop_token() const noexcept { return stop_token_; }
  std::optional<Clock::time_point> deadline() const noexcept {
    return deadline_;
  }

  bool Done() const;
  void ThrowIfDone() const;

 private:
  std::stop_token stop_token_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace certvault
