#include "tessera/core/address.hpp"
#include "tessera/core/hash.hpp"
#include "tessera/core/errors.hpp"

#include <algorithm>
#include <cstring>

namespace tessera::core {

  namespace {
    constexpr const char* kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    constexpr size_t kChecksumLength = 4;

    int alphabet_index(char c) {
      if (c == '\0') return -1;
      const char* p = std::strchr(kAlphabet, c);
      return p ? static_cast<int>(p - kAlphabet) : -1;
    }
  }

  std::string base58_encode(std::span<const uint8_t> data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    // Big-endian base-58 digits of the non-zero tail.
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < data.size(); ++i) {
      int carry = data[i];
      size_t k = 0;
      for (auto it = digits.rbegin(); (carry != 0 || k < used) && it != digits.rend(); ++it, ++k) {
        carry += 256 * (*it);
        *it = static_cast<uint8_t>(carry % 58);
        carry /= 58;
      }
      used = k;
    }

    auto first = std::find_if(digits.begin(), digits.end(), [](uint8_t d) { return d != 0; });
    std::string out(zeros, '1');
    for (auto it = first; it != digits.end(); ++it) out.push_back(kAlphabet[*it]);
    return out;
  }

  std::vector<uint8_t> base58_decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;

    std::vector<uint8_t> bytes(text.size() * 733 / 1000 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
      int carry = alphabet_index(text[i]);
      if (carry < 0) throw InvalidAddressError("base58: invalid character '" + std::string(1, text[i]) + "'");
      size_t k = 0;
      for (auto it = bytes.rbegin(); (carry != 0 || k < used) && it != bytes.rend(); ++it, ++k) {
        carry += 58 * (*it);
        *it = static_cast<uint8_t>(carry % 256);
        carry /= 256;
      }
      used = k;
    }

    auto first = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> out(zeros, 0);
    out.insert(out.end(), first, bytes.end());
    return out;
  }

  std::string base58check_encode(std::span<const uint8_t> payload) {
    std::vector<uint8_t> full(payload.begin(), payload.end());
    const auto checksum = double_sha256(payload);
    full.insert(full.end(), checksum.begin(), checksum.begin() + kChecksumLength);
    return base58_encode(full);
  }

  std::vector<uint8_t> base58check_decode(const std::string& text) {
    auto full = base58_decode(text);
    if (full.size() < kChecksumLength + 1) throw InvalidAddressError("base58check: input too short");

    std::span<const uint8_t> body(full.data(), full.size() - kChecksumLength);
    const auto checksum = double_sha256(body);
    if (!std::equal(checksum.begin(), checksum.begin() + kChecksumLength, full.end() - kChecksumLength))
      throw InvalidAddressError("base58check: checksum mismatch");

    full.resize(body.size());
    return full;
  }

  AddressBytes decode_address(const std::string& address) {
    auto payload = base58check_decode(address);
    if (payload.size() != kAddressLength)
      throw InvalidAddressError("address: expected " + std::to_string(kAddressLength) +
        " bytes, decoded " + std::to_string(payload.size()));
    AddressBytes out{};
    std::copy(payload.begin(), payload.end(), out.begin());
    return out;
  }

  std::string address_from_public_key(const std::string& public_key_hex, uint8_t version) {
    std::vector<uint8_t> public_key;
    try {
      public_key = from_hex(public_key_hex);
    } catch (const MalformedHexError& ex) {
      throw MalformedKeyError(std::string("public key: ") + ex.what());
    }
    const auto key_hash = ripemd160(public_key);
    std::vector<uint8_t> payload;
    payload.reserve(kAddressLength);
    payload.push_back(version);
    payload.insert(payload.end(), key_hash.begin(), key_hash.end());
    return base58check_encode(payload);
  }
}
