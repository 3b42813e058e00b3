#include <tessera/core/hash.hpp>
#include <tessera/core/errors.hpp>
#include <openssl/evp.h>
#include <memory>
#include <span>
#include <sstream>
#include <iomanip>
#include <vector>

namespace tessera::core {

  namespace {
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    template <size_t N>
    std::array<uint8_t, N> digest(const EVP_MD* md, std::span<const uint8_t> data, const char* name) {
      std::array<uint8_t, N> out{};
      EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!ctx || !md) throw CryptoError(std::string(name) + ": digest unavailable");
      if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
        throw CryptoError(std::string(name) + ": EVP_DigestInit_ex");
      if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw CryptoError(std::string(name) + ": EVP_DigestUpdate");
      unsigned int len = static_cast<unsigned int>(out.size());
      if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size())
        throw CryptoError(std::string(name) + ": EVP_DigestFinal_ex");
      return out;
    }

    int unhex_nibble(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
      if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
      return -1;
    }
  }

  auto toHex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) throw MalformedHexError("hex string has odd length: " + std::to_string(hex.size()));
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
      const int hi = unhex_nibble(hex[2 * i]);
      const int lo = unhex_nibble(hex[2 * i + 1]);
      if (hi < 0 || lo < 0) throw MalformedHexError("invalid hex character at offset " + std::to_string(2 * i));
      out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    return digest<32>(EVP_sha256(), data, "sha256");
  }

  auto double_sha256(std::span<const uint8_t> data) -> Hash256 {
    const auto first = sha256(data);
    return sha256(std::span<const uint8_t>(first.data(), first.size()));
  }

  auto ripemd160(std::span<const uint8_t> data) -> Hash160 {
    return digest<20>(EVP_ripemd160(), data, "ripemd160");
  }
}
