// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_VERSION_HPP
#define BRIDGERELAY_VERSION_HPP

#include <cstdint>
#include <string>

namespace bridgerelay {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "Coinbase Chain";

inline std::string GetFullVersionString() {
  return "BridgeRelay version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m"; // Live relaying
constexpr const char *RED = "\033[1;31m";  // Dry run
} // namespace colors

// Startup banner showing the relay route
inline std::string GetStartupBanner(uint64_t source_chain_id,
                                    uint64_t destination_chain_id,
                                    bool dry_run) {
  const char *color = dry_run ? colors::RED : colors::BLUE;

  auto line = [](const std::string &text) {
    std::string row = "║  " + text;
    size_t width = 63;
    if (text.size() + 2 < width) {
      row += std::string(width - text.size() - 2, ' ');
    }
    return row + "║\n";
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner += line("BridgeRelay " + GetVersionString());
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("Route:   chain " + std::to_string(source_chain_id) +
                 " -> chain " + std::to_string(destination_chain_id));
  banner += line(std::string("Mode:    ") +
                 (dry_run ? "DRY RUN (no transactions sent)" : "live"));
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line(GetCopyrightString());
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace bridgerelay

#endif // BRIDGERELAY_VERSION_HPP
