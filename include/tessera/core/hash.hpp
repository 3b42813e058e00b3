#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tessera::core {
  using Hash256 = std::array<uint8_t, 32>;
  using Hash160 = std::array<uint8_t, 20>;

  auto sha256(std::span<const uint8_t> data) -> Hash256;
  auto double_sha256(std::span<const uint8_t> data) -> Hash256;
  auto ripemd160(std::span<const uint8_t> data) -> Hash160;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }
  inline auto ripemd160(const std::string& data) -> Hash160 {
    return ripemd160(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto toHex(std::span<const uint8_t> data) -> std::string;
  inline std::string to_hex(std::span<const uint8_t> data) { return toHex(data); }

  /**
   * Decode a hex string (either case). Throws MalformedHexError on odd
   * length or a non-hex character.
   */
  std::vector<uint8_t> from_hex(const std::string& hex);
}
