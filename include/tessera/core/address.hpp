#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tessera::core {
  constexpr size_t kAddressLength = 21;
  using AddressBytes = std::array<uint8_t, kAddressLength>;

  std::string base58_encode(std::span<const uint8_t> data);
  // Throws InvalidAddressError on a character outside the base58 alphabet.
  std::vector<uint8_t> base58_decode(const std::string& text);

  // Appends the first four bytes of double SHA-256 before encoding.
  std::string base58check_encode(std::span<const uint8_t> payload);
  // Throws InvalidAddressError on bad alphabet, short input or checksum mismatch.
  std::vector<uint8_t> base58check_decode(const std::string& text);

  /**
   * Decode a recipient address to its raw form: version byte followed by the
   * 20-byte RIPEMD-160 of the owner's public key.
   */
  AddressBytes decode_address(const std::string& address);

  std::string address_from_public_key(const std::string& public_key_hex, uint8_t version);
}
