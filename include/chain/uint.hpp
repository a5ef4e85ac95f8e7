// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Based on Bitcoin Core's uint256.h

#ifndef BRIDGERELAY_CHAIN_UINT_HPP
#define BRIDGERELAY_CHAIN_UINT_HPP

#include "util/strencodings.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace bridgerelay {

/**
 * Fixed-size opaque blob
 *
 * Unlike Bitcoin's uint256, bytes are kept in EVM wire order (big-endian):
 * m_data[0] is the most significant byte and GetHex() prints the bytes as
 * stored. Numeric values (token amounts) therefore compare correctly with
 * operator<.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  constexpr bool IsNull() const {
    for (uint8_t val : m_data) {
      if (val != 0)
        return false;
    }
    return true;
  }

  constexpr void SetNull() { m_data.fill(0); }

  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // 0x-prefixed lowercase hex, always 2*WIDTH digits
  std::string GetHex() const { return util::HexStr(m_data.data(), WIDTH); }
  std::string ToString() const { return GetHex(); }

  /**
   * Parse exactly WIDTH bytes of hex (0x prefix optional)
   */
  static std::optional<base_blob> FromHex(std::string_view str) {
    auto bytes = util::ParseHex(str);
    if (!bytes || bytes->size() != static_cast<size_t>(WIDTH)) {
      return std::nullopt;
    }
    base_blob out;
    std::memcpy(out.m_data.data(), bytes->data(), WIDTH);
    return out;
  }

  static base_blob FromBytes(const uint8_t *bytes) {
    base_blob out;
    std::memcpy(out.m_data.data(), bytes, WIDTH);
    return out;
  }

  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *data() { return m_data.data(); }

  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 160-bit opaque blob (EVM account / contract address). */
class uint160 : public base_blob<160> {
public:
  using base_blob<160>::base_blob;
  uint160() = default;
  uint160(const base_blob<160> &b) : base_blob<160>(b) {}

  static std::optional<uint160> FromHex(std::string_view str) {
    auto b = base_blob<160>::FromHex(str);
    if (!b)
      return std::nullopt;
    return uint160(*b);
  }
};

/** 256-bit blob: hashes, log topics and big-endian token amounts. */
class uint256 : public base_blob<256> {
public:
  using base_blob<256>::base_blob;
  uint256() = default;
  uint256(const base_blob<256> &b) : base_blob<256>(b) {}

  static std::optional<uint256> FromHex(std::string_view str) {
    auto b = base_blob<256>::FromHex(str);
    if (!b)
      return std::nullopt;
    return uint256(*b);
  }

  // Big-endian encoding of a 64-bit integer
  static uint256 FromUint64(uint64_t value) {
    uint256 out;
    for (int i = 0; i < 8; ++i) {
      out.m_data[WIDTH - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return out;
  }

  // Value if it fits in 64 bits
  std::optional<uint64_t> GetUint64() const {
    for (int i = 0; i < WIDTH - 8; ++i) {
      if (m_data[i] != 0)
        return std::nullopt;
    }
    uint64_t value = 0;
    for (int i = WIDTH - 8; i < WIDTH; ++i) {
      value = (value << 8) | m_data[i];
    }
    return value;
  }
};

using Address = uint160;

} // namespace bridgerelay

#endif // BRIDGERELAY_CHAIN_UINT_HPP
