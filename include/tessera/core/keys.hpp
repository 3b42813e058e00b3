#pragma once
#include <array>
#include <vector>
#include <cstdint>
#include <string>
#include <span>

#include <tessera/core/hash.hpp>

namespace tessera::core {
  /**
  * secp256k1 key pair derived from a passphrase.
  * - private_key: 32-byte scalar, SHA-256 of the passphrase
  * - public_key: 33-byte compressed point
  */
  struct KeyPair {
    std::array<uint8_t, 32> private_key{};
    std::vector<uint8_t> public_key;

    std::string public_key_hex() const { return to_hex(public_key); }
  };

/**
 * Initialize crypto subsystem; must be called once at startup.
 * Returns true on success.
 */
 bool crypto_init();
 
 /**
  * Cleanup crypto subsystem resources; optional but recommended before process exit.
  */
 void crypto_shutdown();

/**
 * Derive the key pair for a passphrase. Deterministic.
 * Throws CryptoError if the derived scalar is not a valid private key.
 */
 KeyPair derive_keypair(const std::string& secret);

 std::string derive_public_key(const std::string& secret);

/**
 * ECDSA-sign a 32-byte digest as-is (no further hashing).
 * Returns the DER signature as lowercase hex.
 */
 std::string sign_hash(const KeyPair& key_pair, const Hash256& hash);

/**
 * Verify a DER hex signature over a digest.
 * Returns false when the signature does not match or does not decode as DER.
 * Throws VerificationError on malformed hex, an invalid public key or an
 * empty signature.
 */
 bool verify_hash(const std::string& public_key_hex, const Hash256& hash,
  const std::string& signature_hex);
}
