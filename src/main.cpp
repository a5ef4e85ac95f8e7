// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/config.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.bridgerelay)\n"
      << "  --conf=<file>        JSON config file (default: <datadir>/relayer.json "
         "if present)\n"
      << "  --start-block=<n|latest>  First block to scan when no checkpoint "
         "exists\n"
      << "                       (default: latest)\n"
      << "  --rescan-from=<n>    Rewind the checkpoint so block <n> is scanned "
         "again\n"
      << "  --dry-run            Sign mint transactions but never send them\n"
      << "\n"
      << "Environment:\n"
      << "  SOURCE_CHAIN_RPC_URL       Overrides source.rpc_url\n"
      << "  DESTINATION_CHAIN_RPC_URL  Overrides destination.rpc_url\n"
      << "  RELAYER_ACCOUNT            Overrides relayer.account\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: scan, relay, checkpoint, rpc, app, all\n"
      << "                       Can be comma-separated: --debug=scan,rpc\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

std::vector<std::string> split_components(const std::string &components) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < components.length()) {
    size_t comma = components.find(',', pos);
    if (comma == std::string::npos) {
      out.push_back(components.substr(pos));
      break;
    }
    out.push_back(components.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  using namespace bridgerelay;

  try {
    // Command line values, applied last
    std::optional<std::filesystem::path> datadir;
    std::optional<std::filesystem::path> conf_file;
    std::optional<std::string> start_block;
    std::optional<uint64_t> rescan_from;
    bool dry_run = false;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (arg.find("--conf=") == 0) {
        conf_file = arg.substr(7);
      } else if (arg.find("--start-block=") == 0) {
        start_block = arg.substr(14);
      } else if (arg.find("--rescan-from=") == 0) {
        rescan_from = util::ParseUInt64(arg.substr(14));
        if (!rescan_from) {
          std::cerr << "Invalid block number: " << arg << std::endl;
          return 1;
        }
      } else if (arg == "--dry-run") {
        dry_run = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (auto &c : split_components(arg.substr(8))) {
          debug_components.push_back(std::move(c));
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    app::RelayerConfig config;
    config.datadir = datadir ? *datadir : util::get_default_datadir();

    // Config file: explicit --conf must exist, the datadir default may not
    std::filesystem::path default_conf =
        config.datadir / app::RelayerConfig::DEFAULT_CONF_FILENAME;
    std::error_code ec;
    if (!conf_file && std::filesystem::exists(default_conf, ec)) {
      conf_file = default_conf;
    }
    if (conf_file) {
      std::string error;
      if (!app::LoadConfigFile(*conf_file, config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
      }
      config.conf_file = conf_file;
    }

    app::ApplyEnvironment(config);

    if (start_block &&
        !app::ParseStartBlock(*start_block, config.relayer.start_block)) {
      std::cerr << "Invalid --start-block (expected a number or 'latest'): "
                << *start_block << std::endl;
      return 1;
    }
    if (dry_run) {
      config.relayer.dry_run = true;
    }
    config.rescan_from = rescan_from;

    auto problems = app::ValidateConfig(config);
    if (!problems.empty()) {
      std::cerr << "Invalid configuration:" << std::endl;
      for (const auto &problem : problems) {
        std::cerr << "  - " << problem << std::endl;
      }
      return 1;
    }

    if (!util::ensure_directory(config.datadir)) {
      std::cerr << "Cannot create data directory " << config.datadir.string()
                << std::endl;
      return 1;
    }

    // Initialize logging system (file logging in the data directory)
    std::string log_file =
        (config.datadir / app::RelayerConfig::LOG_FILENAME).string();
    util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    if (config.conf_file) {
      LOG_INFO("Loaded config file {}", config.conf_file->string());
    }

    int exit_code = 1;
    {
      app::Application application(config);
      if (!application.initialize()) {
        LOG_ERROR("Failed to initialize application");
      } else {
        exit_code = application.run();
      }
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    bridgerelay::util::LogManager::Shutdown();
    return 1;
  }
}
