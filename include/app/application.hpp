// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_APP_APPLICATION_HPP
#define BRIDGERELAY_APP_APPLICATION_HPP

#include "app/config.hpp"
#include "chain/chain_client.hpp"
#include "relay/checkpoint_store.hpp"
#include "relay/relay_orchestrator.hpp"
#include "util/cancellation.hpp"

#include <cstdint>
#include <memory>

namespace bridgerelay {
namespace app {

/**
 * Application - wires the relayer together and owns every component
 *
 * initialize(): datadir + lock -> chain clients -> connectivity check ->
 *               checkpoint (genesis / rescan) -> orchestrator
 * run():        installs SIGINT/SIGTERM handlers and runs the relay loop
 *               until cancelled; returns the process exit code
 * shutdown():   releases the datadir lock (idempotent, also run by the
 *               destructor)
 *
 * Only one Application may exist at a time (signal handler target).
 */
class Application {
public:
  explicit Application(RelayerConfig config);

  // Use the given clients instead of connecting to config RPC URLs
  Application(RelayerConfig config, std::unique_ptr<chain::ChainClient> source,
              std::unique_ptr<chain::ChainClient> destination);

  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  int run();
  void shutdown();

  // Thread-safe; also what the signal handler triggers
  void request_shutdown() { token_.Cancel(); }

  static Application *instance();

  const RelayerConfig &config() const { return config_; }
  uint64_t source_chain_id() const { return source_chain_id_; }
  uint64_t destination_chain_id() const { return destination_chain_id_; }
  relay::CheckpointStore *checkpoint_store() { return store_.get(); }
  relay::RelayOrchestrator *orchestrator() { return orchestrator_.get(); }

private:
  bool init_datadir();
  void init_clients();
  void check_connectivity();
  void init_checkpoint();
  void init_orchestrator();

  uint64_t resolve_chain_id(chain::ChainClient &client, const char *name,
                            uint64_t configured);
  uint64_t resolve_genesis_block();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  static Application *instance_;

  RelayerConfig config_;
  std::unique_ptr<chain::ChainClient> source_;
  std::unique_ptr<chain::ChainClient> destination_;
  uint64_t source_chain_id_{0};
  uint64_t destination_chain_id_{0};

  std::unique_ptr<relay::CheckpointStore> store_;
  std::unique_ptr<relay::RelayOrchestrator> orchestrator_;
  util::CancellationToken token_;

  bool datadir_locked_{false};
  bool initialized_{false};
};

} // namespace app
} // namespace bridgerelay

#endif // BRIDGERELAY_APP_APPLICATION_HPP
