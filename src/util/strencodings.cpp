// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/strencodings.hpp"
#include <limits>

namespace bridgerelay {
namespace util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

std::string_view StripHexPrefix(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  return str;
}

bool IsHex(std::string_view str) {
  str = StripHexPrefix(str);
  if (str.empty() || (str.size() % 2) != 0) {
    return false;
  }
  for (char c : str) {
    if (HexDigit(c) < 0)
      return false;
  }
  return true;
}

std::optional<std::vector<uint8_t>> ParseHex(std::string_view str) {
  str = StripHexPrefix(str);
  if ((str.size() % 2) != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigit(str[i]);
    int lo = HexDigit(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string HexStr(const uint8_t *data, size_t len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(2 + len * 2);
  out += "0x";
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::optional<uint64_t> ParseQuantity(std::string_view str) {
  if (str.size() < 3 || str[0] != '0' || (str[1] != 'x' && str[1] != 'X')) {
    return std::nullopt;
  }
  str.remove_prefix(2);
  if (str.size() > 16) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (char c : str) {
    int d = HexDigit(c);
    if (d < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<uint64_t>(d);
  }
  return value;
}

std::string ToQuantity(uint64_t value) {
  static constexpr char kDigits[] = "0123456789abcdef";
  if (value == 0) {
    return "0x0";
  }
  std::string digits;
  while (value > 0) {
    digits.insert(digits.begin(), kDigits[value & 0x0f]);
    value >>= 4;
  }
  return "0x" + digits;
}

std::optional<uint64_t> ParseUInt64(std::string_view str) {
  if (str.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char c : str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace util
} // namespace bridgerelay
