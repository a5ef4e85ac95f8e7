// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/cancellation.hpp"
#include <algorithm>

namespace bridgerelay {
namespace util {

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;

  std::unique_lock<std::mutex> lock(mutex_);
  while (!IsCancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, SIGNAL_POLL_SLICE);
    cv_.wait_for(lock, slice, [this] { return cancelled_.load(); });
  }
  return true;
}

} // namespace util
} // namespace bridgerelay
