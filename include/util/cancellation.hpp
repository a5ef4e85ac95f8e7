// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_UTIL_CANCELLATION_HPP
#define BRIDGERELAY_UTIL_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bridgerelay {
namespace util {

/**
 * CancellationToken - cooperative shutdown flag
 *
 * Cancel() may be called from any thread. The relay loop polls
 * IsCancelled() between states and blocks in WaitFor() while sleeping,
 * so a shutdown request wakes the sleep immediately.
 *
 * Cancel() takes a mutex and is therefore not async-signal-safe; signal
 * handlers set RequestFromSignal() instead, which only stores an atomic
 * flag that WaitFor() notices within its poll slice.
 */
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void Cancel();

  // Async-signal-safe variant (lock-free store only)
  void RequestFromSignal() { signal_requested_.store(true); }

  bool IsCancelled() const {
    return cancelled_.load() || signal_requested_.load();
  }

  /**
   * Sleep for up to `duration`
   * @return true if cancelled before or during the wait
   */
  bool WaitFor(std::chrono::milliseconds duration);

private:
  // Upper bound on how long a signal request goes unnoticed while waiting
  static constexpr std::chrono::milliseconds SIGNAL_POLL_SLICE{100};

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> signal_requested_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace util
} // namespace bridgerelay

#endif // BRIDGERELAY_UTIL_CANCELLATION_HPP
