// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/relay_orchestrator.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace bridgerelay {
namespace relay {

const char *RelayStateName(RelayState state) {
  switch (state) {
  case RelayState::IDLE:
    return "IDLE";
  case RelayState::FETCH_TIP:
    return "FETCH_TIP";
  case RelayState::COMPUTE_WINDOW:
    return "COMPUTE_WINDOW";
  case RelayState::SCAN:
    return "SCAN";
  case RelayState::BUILD_AND_SUBMIT:
    return "BUILD_AND_SUBMIT";
  case RelayState::COMMIT:
    return "COMMIT";
  case RelayState::SLEEP:
    return "SLEEP";
  case RelayState::SHUTTING_DOWN:
    return "SHUTTING_DOWN";
  }
  return "UNKNOWN";
}

RelayOrchestrator::RelayOrchestrator(chain::ChainClient &source,
                                     chain::ChainClient &destination,
                                     CheckpointStore &store,
                                     RelayOptions options)
    : source_(source), destination_(destination), store_(store),
      options_(std::move(options)),
      scanner_(source_, options_.filter, options_.source_chain_id,
               options_.destination_chain_id),
      builder_(options_.destination_chain_id),
      backoff_(options_.polling_interval, options_.max_backoff) {}

void RelayOrchestrator::Enter(CycleContext &ctx, RelayState state) {
  LOG_RELAY_TRACE("{} -> {}", RelayStateName(ctx.state), RelayStateName(state));
  ctx.state = state;
  state_ = state;
}

bool RelayOrchestrator::CheckCancelled(CycleContext &ctx,
                                       util::CancellationToken &token) {
  if (!token.IsCancelled()) {
    return false;
  }
  ctx.outcome = CycleOutcome::Cancelled;
  Enter(ctx, RelayState::SHUTTING_DOWN);
  return true;
}

CycleContext RelayOrchestrator::RunCycle(util::CancellationToken &token) {
  CycleContext ctx;
  ctx.resolved_through = store_.LastScannedBlock();
  ++stats_.cycles;

  Enter(ctx, RelayState::IDLE);
  if (CheckCancelled(ctx, token))
    return ctx;

  Enter(ctx, RelayState::FETCH_TIP);
  FetchTip(ctx);
  if (ctx.state == RelayState::SLEEP || CheckCancelled(ctx, token))
    return ctx;

  Enter(ctx, RelayState::COMPUTE_WINDOW);
  ComputeWindow(ctx);
  if (ctx.state == RelayState::SLEEP || CheckCancelled(ctx, token))
    return ctx;

  Enter(ctx, RelayState::SCAN);
  ScanWindowEvents(ctx);
  if (ctx.state == RelayState::SLEEP || CheckCancelled(ctx, token))
    return ctx;

  Enter(ctx, RelayState::BUILD_AND_SUBMIT);
  BuildAndSubmit(ctx, token);

  // Always reached once anything may have been submitted; a cancellation
  // that arrived meanwhile waits for this commit
  Enter(ctx, RelayState::COMMIT);
  CommitProgress(ctx);

  if (token.IsCancelled()) {
    ctx.outcome = CycleOutcome::Cancelled;
    Enter(ctx, RelayState::SHUTTING_DOWN);
    return ctx;
  }
  Enter(ctx, RelayState::SLEEP);
  return ctx;
}

void RelayOrchestrator::FetchTip(CycleContext &ctx) {
  try {
    ctx.tip = source_.GetTipHeight();
  } catch (const TransientFetchError &e) {
    LOG_RELAY_WARN("Failed to fetch source tip: {}", e.what());
    ctx.error = e.what();
    ctx.outcome = CycleOutcome::TransientFailure;
    ++stats_.transient_failures;
    Enter(ctx, RelayState::SLEEP);
  }
}

void RelayOrchestrator::ComputeWindow(CycleContext &ctx) {
  ctx.window = RangeScanner::NextWindow(store_.Current(), *ctx.tip,
                                        options_.max_window_size,
                                        options_.confirmation_lag);
  if (!ctx.window) {
    LOG_RELAY_DEBUG("No new confirmed blocks (tip {}, last scanned {}, lag {})",
                    *ctx.tip, store_.LastScannedBlock(),
                    options_.confirmation_lag);
    ctx.outcome = CycleOutcome::Idle;
    Enter(ctx, RelayState::SLEEP);
  }
}

void RelayOrchestrator::ScanWindowEvents(CycleContext &ctx) {
  try {
    ctx.events = scanner_.Scan(*ctx.window);
  } catch (const TransientFetchError &e) {
    LOG_RELAY_WARN("Failed to scan blocks {}: {}", ctx.window->ToString(),
                   e.what());
    ctx.error = e.what();
    ctx.outcome = CycleOutcome::TransientFailure;
    ++stats_.transient_failures;
    Enter(ctx, RelayState::SLEEP);
  }
}

void RelayOrchestrator::BuildAndSubmit(CycleContext &ctx,
                                       util::CancellationToken &token) {
  const ScanWindow &window = *ctx.window;
  ctx.outcome = CycleOutcome::Progress;

  for (const auto &event : ctx.events) {
    if (token.IsCancelled()) {
      LOG_RELAY_INFO("Shutdown requested; stopping before event {}",
                     event.Id().ToString());
      ctx.aborted_at_block = event.source_block_number;
      ctx.outcome = CycleOutcome::Cancelled;
      break;
    }

    chain::RelayAction action;
    try {
      action = builder_.Build(event);
    } catch (const MalformedEventError &e) {
      LOG_RELAY_WARN("Skipping malformed event in block {}: {}",
                     event.source_block_number, e.what());
      ++ctx.malformed;
      ++stats_.malformed;
      continue;
    }

    if (store_.Contains(action.idempotency_key)) {
      LOG_RELAY_DEBUG("Event {} already relayed, skipping",
                      action.idempotency_key.ToString());
      ++ctx.duplicates;
      ++stats_.duplicates;
      continue;
    }

    try {
      auto signed_action = destination_.Sign(action, options_.signing_key);
      auto handle = destination_.Submit(signed_action);
      ctx.submitted_ids.push_back(
          ProcessedId{action.idempotency_key, event.source_block_number});
      ++stats_.submitted;
      LOG_RELAY_INFO("Relayed {} -> mint {} of {} to {} (handle {})",
                     action.idempotency_key.ToString(), action.amount.GetHex(),
                     action.asset_id.GetHex(), action.recipient.GetHex(),
                     handle.id);
    } catch (const SubmissionError &e) {
      LOG_RELAY_ERROR("Submission failed for {} in block {}: {}",
                      action.idempotency_key.ToString(),
                      event.source_block_number, e.what());
      ctx.error = e.what();
      ctx.aborted_at_block = event.source_block_number;
      ctx.outcome = CycleOutcome::SubmissionFailure;
      ++stats_.submission_failures;
      break;
    }
  }

  if (ctx.aborted_at_block) {
    // Scan windows start at last_scanned_block + 1 >= 1, so no underflow
    ctx.resolved_through = *ctx.aborted_at_block - 1;
  } else {
    ctx.resolved_through = window.to_block;
    ctx.backlog = window.to_block < *ctx.tip - options_.confirmation_lag;
  }
}

void RelayOrchestrator::CommitProgress(CycleContext &ctx) {
  const uint64_t current = store_.LastScannedBlock();
  const uint64_t target = std::max(current, ctx.resolved_through);

  if (target == current && ctx.submitted_ids.empty()) {
    return;
  }

  try {
    store_.Commit(target, ctx.submitted_ids);
    ctx.committed_block = target;
    LOG_RELAY_INFO("Checkpoint at block {} ({} submitted, {} duplicate, {} "
                   "malformed)",
                   target, ctx.submitted_ids.size(), ctx.duplicates,
                   ctx.malformed);
  } catch (const StorageError &e) {
    LOG_RELAY_ERROR("Checkpoint commit failed, will rescan from block {}: {}",
                    current + 1, e.what());
    ctx.error = e.what();
    ctx.outcome = CycleOutcome::StorageFailure;
    ctx.backlog = false;
    ++stats_.storage_failures;
  }
}

void RelayOrchestrator::Run(util::CancellationToken &token) {
  LOG_RELAY_INFO("Relay loop starting after block {} (window {}, lag {}, "
                 "interval {} ms)",
                 store_.LastScannedBlock(), options_.max_window_size,
                 options_.confirmation_lag, options_.polling_interval.count());

  while (!token.IsCancelled()) {
    CycleContext ctx = RunCycle(token);
    if (ctx.state == RelayState::SHUTTING_DOWN) {
      break;
    }

    auto delay = backoff_.NextDelay(ctx.outcome, ctx.backlog);
    if (backoff_.ConsecutiveFailures() > 1) {
      LOG_RELAY_WARN("{} consecutive failed cycles, next attempt in {} ms",
                     backoff_.ConsecutiveFailures(), delay.count());
    }
    if (token.WaitFor(delay)) {
      break;
    }
  }

  state_ = RelayState::SHUTTING_DOWN;
  LOG_RELAY_INFO("Relay loop stopped at block {}: {} cycles, {} submitted, {} "
                 "duplicate, {} malformed, {} fetch / {} submission / {} "
                 "storage failures",
                 store_.LastScannedBlock(), stats_.cycles, stats_.submitted,
                 stats_.duplicates, stats_.malformed,
                 stats_.transient_failures, stats_.submission_failures,
                 stats_.storage_failures);
}

} // namespace relay
} // namespace bridgerelay
