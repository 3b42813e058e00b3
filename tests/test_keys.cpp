#include <gtest/gtest.h>
#include "tessera/core/keys.hpp"
#include "tessera/core/errors.hpp"

#include <openssl/opensslv.h>

using namespace tessera::core;

namespace {
  std::string flip_byte(const std::string& hex, size_t index) {
    auto bytes = from_hex(hex);
    bytes.at(index) ^= 0x01;
    return to_hex(bytes);
  }
}

TEST(KeysDerive, DeterministicForSameSecret) {
    ASSERT_TRUE(crypto_init());
    auto key_pair_1 = derive_keypair("this is a top secret passphrase");
    auto key_pair_2 = derive_keypair("this is a top secret passphrase");
    EXPECT_EQ(key_pair_1.private_key, key_pair_2.private_key);
    EXPECT_EQ(key_pair_1.public_key, key_pair_2.public_key);
    EXPECT_EQ(key_pair_1.private_key, sha256("this is a top secret passphrase"));
}

TEST(KeysDerive, CompressedPublicKey) {
    ASSERT_TRUE(crypto_init());
    auto public_key = derive_public_key("alpha");
    ASSERT_EQ(public_key.size(), 66u);
    EXPECT_TRUE(public_key.rfind("02", 0) == 0 || public_key.rfind("03", 0) == 0);
    EXPECT_NE(public_key, derive_public_key("beta"));
}

TEST(KeysRoundTrip, SignVerifyOK) {
    ASSERT_TRUE(crypto_init());
    auto key_pair = derive_keypair("alpha");
    auto digest = sha256("tessera test message");
    auto signature = sign_hash(key_pair, digest);
    EXPECT_FALSE(signature.empty());
    EXPECT_TRUE(verify_hash(key_pair.public_key_hex(), digest, signature));
}

TEST(KeysTamper, VerifyFailsOnWrongDigest) {
    ASSERT_TRUE(crypto_init());
    auto key_pair = derive_keypair("alpha");
    auto signature = sign_hash(key_pair, sha256("tessera test message"));
    EXPECT_FALSE(verify_hash(key_pair.public_key_hex(), sha256("different message"), signature));
}

TEST(KeysMismatch, VerifyFailsWithDifferentPublicKey) {
  ASSERT_TRUE(crypto_init());
  auto key_pair_1 = derive_keypair("alpha");
  auto key_pair_2 = derive_keypair("beta");
  auto digest = sha256("tessera mismatch");
  auto signature = sign_hash(key_pair_1, digest);
  EXPECT_FALSE(verify_hash(key_pair_2.public_key_hex(), digest, signature));
}

TEST(KeysTamperSignature, VerifyFailsWhenSignatureAltered) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = derive_keypair("alpha");
  auto digest = sha256("tessera tamper");
  auto signature = sign_hash(key_pair, digest);
  auto signature_size = from_hex(signature).size();
  ASSERT_GT(signature_size, 8u);
  EXPECT_FALSE(verify_hash(key_pair.public_key_hex(), digest, flip_byte(signature, signature_size - 1)));
  // Header byte: the DER no longer parses, still a plain false.
  EXPECT_FALSE(verify_hash(key_pair.public_key_hex(), digest, flip_byte(signature, 0)));
}

TEST(KeysInvalidSig, VerifyFalseOnTruncatedSignature) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = derive_keypair("alpha");
  auto digest = sha256("tessera trunc");
  auto signature = sign_hash(key_pair, digest);
  signature.resize(signature.size() / 2);
  if (signature.size() % 2 != 0) signature.pop_back();
  EXPECT_FALSE(verify_hash(key_pair.public_key_hex(), digest, signature));
}

TEST(KeysMalformed, VerifyThrowsOnMalformedInputs) {
  ASSERT_TRUE(crypto_init());
  auto key_pair = derive_keypair("alpha");
  auto digest = sha256("tessera malformed");
  auto signature = sign_hash(key_pair, digest);

  EXPECT_THROW(verify_hash("not-hex", digest, signature), VerificationError);
  EXPECT_THROW(verify_hash(key_pair.public_key_hex(), digest, "xyz"), VerificationError);
  EXPECT_THROW(verify_hash(key_pair.public_key_hex(), digest, ""), VerificationError);
  // x coordinate above the field prime is not a curve point
  EXPECT_THROW(verify_hash("02" + std::string(64, 'f'), digest, signature), VerificationError);
  EXPECT_THROW(verify_hash("", digest, signature), VerificationError);
}

TEST(KeysDeterministic, SameDigestSameSignature) {
#if OPENSSL_VERSION_NUMBER < 0x30200000L
  GTEST_SKIP() << "RFC 6979 nonces need OpenSSL 3.2";
#else
  ASSERT_TRUE(crypto_init());
  auto key_pair = derive_keypair("alpha");
  auto digest = sha256("tessera deterministic");
  auto signature = sign_hash(key_pair, digest);
  EXPECT_EQ(signature, sign_hash(key_pair, digest));
  EXPECT_NE(signature, sign_hash(key_pair, sha256("tessera other")));
  EXPECT_TRUE(verify_hash(key_pair.public_key_hex(), digest, signature));
#endif
}

TEST(CryptoInit, IdempotentCallsSucceed) {
  EXPECT_TRUE(crypto_init());
  EXPECT_TRUE(crypto_init());
}
