// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RELAY_BACKOFF_HPP
#define BRIDGERELAY_RELAY_BACKOFF_HPP

#include <chrono>
#include <cstdint>

namespace bridgerelay {
namespace relay {

// How a relay cycle ended; drives the delay before the next one
enum class CycleOutcome {
  Progress,          // Window scanned and committed
  Idle,              // No window available yet
  TransientFailure,  // Tip or log fetch failed
  SubmissionFailure, // Destination rejected or was unreachable
  StorageFailure,    // Checkpoint commit failed
  Cancelled,
};

const char *CycleOutcomeName(CycleOutcome outcome);

/**
 * BackoffPolicy - delay between relay cycles
 *
 * - Progress with backlog (more blocks already confirmed): no delay
 * - Progress / Idle: the polling interval, failure streak reset
 * - Failures: polling interval doubled per consecutive failure, capped at
 *   max_backoff
 */
class BackoffPolicy {
public:
  BackoffPolicy(std::chrono::milliseconds polling_interval,
                std::chrono::milliseconds max_backoff);

  std::chrono::milliseconds NextDelay(CycleOutcome outcome, bool backlog = false);

  void Reset() { consecutive_failures_ = 0; }
  uint32_t ConsecutiveFailures() const { return consecutive_failures_; }

private:
  std::chrono::milliseconds polling_interval_;
  std::chrono::milliseconds max_backoff_;
  uint32_t consecutive_failures_{0};
};

} // namespace relay
} // namespace bridgerelay

#endif // BRIDGERELAY_RELAY_BACKOFF_HPP
