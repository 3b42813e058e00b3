#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <span>
#include <string>
#include <tessera/core/asset.hpp>
#include <tessera/core/dict.hpp>
#include <tessera/core/hash.hpp>

namespace tessera::core {

 /**
  * One transaction and its canonical byte encoding.
  *
  * Canonical layout, in order:
  *   type (1) | timestamp (4, LE) | sender public key | [requester public key]
  *   | recipient (21) | vendor field (64) | amount (8, LE) | fee (8, LE)
  *   | asset bytes | [signature] | [second signature]
  *
  * The object is owned by one caller while it is being signed; distinct
  * instances share no state.
  */
 struct Transaction {
  uint8_t type = static_cast<uint8_t>(TransactionType::Transfer);
  uint32_t timestamp = 0;

  std::string sender_public_key;
  std::optional<std::string> requester_public_key;
  std::optional<std::string> recipient_id;
  std::optional<std::string> vendor_field;  // hex, at most 64 raw bytes

  uint64_t amount = 0;
  std::optional<uint64_t> fee;
  Asset asset;

  std::optional<std::string> id;
  std::optional<std::string> signature;
  std::optional<std::string> second_signature;

  /**
   * Canonical bytes. A signature section is written only when its skip flag
   * is false, and then it must be present (MissingSignatureError otherwise).
   * Either the whole sequence is returned or an exception is thrown.
   */
  std::vector<uint8_t> to_bytes(bool skip_signature=true, bool skip_second_signature=true) const;

  Hash256 hash(bool skip_signature=true, bool skip_second_signature=true) const;

  // Hex SHA-256 of the bytes without either signature.
  std::string get_id() const;

  // Digest covered by the first signature: no signature sections.
  Hash256 signing_hash() const;
  // Digest covered by the second signature: first signature included.
  Hash256 second_signing_hash() const;

  void sign(const std::string& secret);

  // Requires the first signature to be set.
  void second_sign(const std::string& secret);

  // Malformed keys or signatures throw VerificationError; a mismatch is false.
  bool verify() const;

  // Checks second_signature over second_signing_hash(), the same digest
  // second_sign() signed (first signature included). The no-argument form
  // checks against sender_public_key; pass the second key when it differs.
  bool second_verify() const;
  bool second_verify(const std::string& second_public_key) const;

  Dict to_dict() const;
 };

 Dict asset_to_dict(const Asset& asset);

}
