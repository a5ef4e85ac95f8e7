// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/backoff.hpp"

#include <algorithm>

namespace bridgerelay {
namespace relay {

const char *CycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::Progress:
    return "progress";
  case CycleOutcome::Idle:
    return "idle";
  case CycleOutcome::TransientFailure:
    return "transient-failure";
  case CycleOutcome::SubmissionFailure:
    return "submission-failure";
  case CycleOutcome::StorageFailure:
    return "storage-failure";
  case CycleOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds polling_interval,
                             std::chrono::milliseconds max_backoff)
    : polling_interval_(polling_interval),
      max_backoff_(std::max(max_backoff, polling_interval)) {}

std::chrono::milliseconds BackoffPolicy::NextDelay(CycleOutcome outcome,
                                                   bool backlog) {
  switch (outcome) {
  case CycleOutcome::Progress:
    consecutive_failures_ = 0;
    return backlog ? std::chrono::milliseconds(0) : polling_interval_;
  case CycleOutcome::Idle:
    consecutive_failures_ = 0;
    return polling_interval_;
  case CycleOutcome::Cancelled:
    return std::chrono::milliseconds(0);
  case CycleOutcome::TransientFailure:
  case CycleOutcome::SubmissionFailure:
  case CycleOutcome::StorageFailure:
    break;
  }

  ++consecutive_failures_;

  // interval * 2^(failures-1), stopping as soon as the cap is reached
  auto delay = polling_interval_;
  for (uint32_t i = 1; i < consecutive_failures_ && delay < max_backoff_; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_backoff_);
}

} // namespace relay
} // namespace bridgerelay
