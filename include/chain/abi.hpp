// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_CHAIN_ABI_HPP
#define BRIDGERELAY_CHAIN_ABI_HPP

#include "chain/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace bridgerelay {
namespace chain {

using FunctionSelector = std::array<uint8_t, 4>;

/**
 * Decoded TokensLocked arguments
 *
 * event TokensLocked(address indexed token, address indexed sender,
 *                    address indexed recipient, uint256 amount,
 *                    uint256 destinationChainId)
 */
struct TokensLocked {
  Address token;
  Address sender;
  Address recipient;
  uint256 amount;
  uint256 destination_chain_id;
};

// Address from a 32-byte word; nullopt if the 12 padding bytes are not zero
std::optional<Address> AddressFromWord(const uint256 &word);

uint256 WordFromAddress(const Address &address);

/**
 * Decode topics[1..3] and data of a TokensLocked log.
 * Requires exactly 4 topics and 64 bytes of data; topic0 is not checked.
 */
std::optional<TokensLocked> DecodeTokensLocked(const RawLog &log);

// "0x1234abcd" -> selector; nullopt unless exactly 4 hex bytes
std::optional<FunctionSelector> ParseSelector(std::string_view hex);

/**
 * Calldata for
 *   mint(address token, address recipient, uint256 amount,
 *        uint256 sourceChainId, bytes32 sourceTxHash, uint256 logIndex)
 * All arguments are static, so the encoding is selector + 6 words.
 */
std::vector<uint8_t> EncodeMintCall(const FunctionSelector &selector,
                                    const RelayAction &action);

} // namespace chain
} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_ABI_HPP
