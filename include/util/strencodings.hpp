// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_UTIL_STRENCODINGS_HPP
#define BRIDGERELAY_UTIL_STRENCODINGS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgerelay {
namespace util {

// Strip a leading "0x"/"0X" if present
std::string_view StripHexPrefix(std::string_view str);

// True if str (after an optional 0x prefix) is a non-empty even-length hex
// string
bool IsHex(std::string_view str);

// Decode hex (optional 0x prefix). nullopt on odd length or bad digit.
std::optional<std::vector<uint8_t>> ParseHex(std::string_view str);

// Lowercase hex with a 0x prefix
std::string HexStr(const uint8_t *data, size_t len);
std::string HexStr(const std::vector<uint8_t> &data);

/**
 * JSON-RPC quantity encoding ("0x0", "0x1a"): no leading zeros, any length
 * up to 64 bits. nullopt on overflow or bad digit.
 */
std::optional<uint64_t> ParseQuantity(std::string_view str);
std::string ToQuantity(uint64_t value);

// Strict decimal parser for config values and CLI flags
std::optional<uint64_t> ParseUInt64(std::string_view str);

} // namespace util
} // namespace bridgerelay

#endif // BRIDGERELAY_UTIL_STRENCODINGS_HPP
