// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RELAY_RELAY_ORCHESTRATOR_HPP
#define BRIDGERELAY_RELAY_RELAY_ORCHESTRATOR_HPP

#include "chain/chain_client.hpp"
#include "relay/action_builder.hpp"
#include "relay/backoff.hpp"
#include "relay/checkpoint_store.hpp"
#include "relay/range_scanner.hpp"
#include "util/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace relay {

enum class RelayState {
  IDLE,
  FETCH_TIP,
  COMPUTE_WINDOW,
  SCAN,
  BUILD_AND_SUBMIT,
  COMMIT,
  SLEEP,
  SHUTTING_DOWN,
};

const char *RelayStateName(RelayState state);

struct RelayOptions {
  chain::LogFilter filter;
  uint64_t source_chain_id{0};
  uint64_t destination_chain_id{0};
  std::string signing_key; // Relayer account handed to ChainClient::Sign

  uint64_t max_window_size{100};
  uint64_t confirmation_lag{12};
  std::chrono::milliseconds polling_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds max_backoff{std::chrono::seconds(300)};
};

/**
 * CycleContext - everything one pass through the state machine touched
 *
 * Created fresh by RunCycle() and threaded through each state; returned to
 * the caller as the cycle report.
 */
struct CycleContext {
  RelayState state{RelayState::IDLE};
  CycleOutcome outcome{CycleOutcome::Idle};

  std::optional<uint64_t> tip;
  std::optional<ScanWindow> window;
  std::vector<chain::DomainEvent> events;

  // Keys accepted by the destination during this cycle
  std::vector<ProcessedId> submitted_ids;
  // Highest block whose events are all submitted, deduplicated or skipped
  uint64_t resolved_through{0};
  // Set when submission stopped early (failure or cancellation)
  std::optional<uint64_t> aborted_at_block;

  size_t duplicates{0};
  size_t malformed{0};

  std::optional<uint64_t> committed_block;
  bool backlog{false}; // More confirmed blocks remain after this window
  std::string error;
};

// Running totals, logged at shutdown
struct RelayStats {
  uint64_t cycles{0};
  uint64_t submitted{0};
  uint64_t duplicates{0};
  uint64_t malformed{0};
  uint64_t transient_failures{0};
  uint64_t submission_failures{0};
  uint64_t storage_failures{0};
};

/**
 * RelayOrchestrator - the relay control loop
 *
 *   IDLE -> FETCH_TIP -> COMPUTE_WINDOW -> SCAN -> BUILD_AND_SUBMIT
 *        -> COMMIT -> SLEEP -> IDLE
 *
 * SHUTTING_DOWN is entered from any state once the token is cancelled. A
 * cancellation during BUILD_AND_SUBMIT stops before the next submission
 * and still commits what was already submitted.
 *
 * last_scanned_block only advances over blocks whose events are fully
 * resolved; a failed submission in block B commits at most B - 1 (plus
 * the keys already submitted from B, so the retry skips them).
 *
 * Single-threaded: Run()/RunCycle() must not be called concurrently.
 */
class RelayOrchestrator {
public:
  RelayOrchestrator(chain::ChainClient &source, chain::ChainClient &destination,
                    CheckpointStore &store, RelayOptions options);

  /**
   * One pass IDLE..SLEEP (or SHUTTING_DOWN). Does not sleep.
   * Throws only for errors outside the relay taxonomy.
   */
  CycleContext RunCycle(util::CancellationToken &token);

  /**
   * Loop RunCycle() with BackoffPolicy delays until cancelled
   */
  void Run(util::CancellationToken &token);

  RelayState State() const { return state_; }
  const RelayStats &Stats() const { return stats_; }
  const RelayOptions &Options() const { return options_; }

private:
  void Enter(CycleContext &ctx, RelayState state);
  bool CheckCancelled(CycleContext &ctx, util::CancellationToken &token);

  void FetchTip(CycleContext &ctx);
  void ComputeWindow(CycleContext &ctx);
  void ScanWindowEvents(CycleContext &ctx);
  void BuildAndSubmit(CycleContext &ctx, util::CancellationToken &token);
  void CommitProgress(CycleContext &ctx);

  chain::ChainClient &source_;
  chain::ChainClient &destination_;
  CheckpointStore &store_;
  RelayOptions options_;

  RangeScanner scanner_;
  ActionBuilder builder_;
  BackoffPolicy backoff_;

  RelayState state_{RelayState::IDLE};
  RelayStats stats_;
};

} // namespace relay
} // namespace bridgerelay

#endif // BRIDGERELAY_RELAY_RELAY_ORCHESTRATOR_HPP
