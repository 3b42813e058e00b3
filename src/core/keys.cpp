#include "tessera/core/keys.hpp"
#include "tessera/core/errors.hpp"
#include <openssl/evp.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/core_names.h>
#include <openssl/params.h>
#include <openssl/param_build.h>
#include <openssl/err.h>
#include <openssl/crypto.h>
#include <openssl/opensslv.h>

#include <memory>

namespace tessera::core {

  namespace  {

    constexpr const char* kCurveName = "secp256k1";
    constexpr size_t kCompressedKeyLength = 33;

    [[noreturn]] void throw_openssl_error(const std::string& context) {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      throw CryptoError(context + ": " + err_buf);
    }

    using EVP_PKEY_Ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EVP_PKEY_CTX_Ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
    using BN_Ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
    using EC_GROUP_Ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
    using EC_POINT_Ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
    using PARAM_BLD_Ptr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
    using PARAM_Ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

    // Builds an EC EVP_PKEY from a public point and, optionally, a private scalar.
    // Returns an empty pointer if OpenSSL rejects the point.
    EVP_PKEY_Ptr import_key(std::span<const uint8_t> public_key, const BIGNUM* private_key) {
      PARAM_BLD_Ptr builder(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
      if (!builder) throw_openssl_error("OSSL_PARAM_BLD_new");

      if (OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, kCurveName, 0) != 1)
        throw_openssl_error("OSSL_PARAM_BLD_push_utf8_string");
      if (OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
          public_key.data(), public_key.size()) != 1)
        throw_openssl_error("OSSL_PARAM_BLD_push_octet_string");
      if (private_key && OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY, private_key) != 1)
        throw_openssl_error("OSSL_PARAM_BLD_push_BN");

      PARAM_Ptr params(OSSL_PARAM_BLD_to_param(builder.get()), &OSSL_PARAM_free);
      if (!params) throw_openssl_error("OSSL_PARAM_BLD_to_param");

      EVP_PKEY_CTX_Ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), &EVP_PKEY_CTX_free);
      if (!ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_name");
      if (EVP_PKEY_fromdata_init(ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_fromdata_init");

      EVP_PKEY* raw_key = nullptr;
      const int selection = private_key ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
      if (EVP_PKEY_fromdata(ctx.get(), &raw_key, selection, params.get()) <= 0) {
        ERR_clear_error();
        return EVP_PKEY_Ptr(nullptr, &EVP_PKEY_free);
      }
      return EVP_PKEY_Ptr(raw_key, &EVP_PKEY_free);
    }
  }

  bool crypto_init() {
    if (OPENSSL_init_crypto(0, nullptr) != 1) {
      return false;
    }
    ERR_load_crypto_strings();
    return true;
  }
 
  void crypto_shutdown() {
    OPENSSL_cleanup();
  }

  KeyPair derive_keypair(const std::string& secret) {
    KeyPair key_pair;
    key_pair.private_key = sha256(secret);

    EC_GROUP_Ptr group(EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free);
    if (!group) throw_openssl_error("EC_GROUP_new_by_curve_name");

    BN_Ptr scalar(BN_bin2bn(key_pair.private_key.data(), static_cast<int>(key_pair.private_key.size()), nullptr), &BN_free);
    if (!scalar) throw_openssl_error("BN_bin2bn");
    if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0)
      throw CryptoError("derive_keypair: secret hashes outside the curve order");

    EC_POINT_Ptr point(EC_POINT_new(group.get()), &EC_POINT_free);
    if (!point) throw_openssl_error("EC_POINT_new");
    if (EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr, nullptr) != 1)
      throw_openssl_error("EC_POINT_mul");

    key_pair.public_key.resize(kCompressedKeyLength);
    size_t written = EC_POINT_point2oct(group.get(), point.get(), POINT_CONVERSION_COMPRESSED,
      key_pair.public_key.data(), key_pair.public_key.size(), nullptr);
    if (written != kCompressedKeyLength) throw_openssl_error("EC_POINT_point2oct");

    return key_pair;
  }

  std::string derive_public_key(const std::string& secret) {
    return derive_keypair(secret).public_key_hex();
  }

  std::string sign_hash(const KeyPair& key_pair, const Hash256& hash) {
    BN_Ptr scalar(BN_bin2bn(key_pair.private_key.data(), static_cast<int>(key_pair.private_key.size()), nullptr), &BN_free);
    if (!scalar) throw_openssl_error("BN_bin2bn");

    EVP_PKEY_Ptr key_handle = import_key(key_pair.public_key, scalar.get());
    if (!key_handle) throw CryptoError("sign_hash: key pair rejected by OpenSSL");

    EVP_PKEY_CTX_Ptr sign_ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_handle.get(), nullptr), &EVP_PKEY_CTX_free);
    if (!sign_ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_pkey");
    if (EVP_PKEY_sign_init(sign_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_sign_init");

#if OPENSSL_VERSION_NUMBER >= 0x30200000L
    // RFC 6979 nonces: the same key and digest always give the same signature.
    unsigned int nonce_type = 1;
    OSSL_PARAM nonce_params[] = {
      OSSL_PARAM_construct_uint(OSSL_SIGNATURE_PARAM_NONCE_TYPE, &nonce_type),
      OSSL_PARAM_construct_end()
    };
    if (EVP_PKEY_CTX_set_params(sign_ctx.get(), nonce_params) <= 0)
      throw_openssl_error("EVP_PKEY_CTX_set_params (nonce-type)");
#endif

    size_t sig_len = 0;
    if (EVP_PKEY_sign(sign_ctx.get(), nullptr, &sig_len, hash.data(), hash.size()) <= 0)
      throw_openssl_error("EVP_PKEY_sign (get length)");

    std::vector<uint8_t> signature(sig_len);
    if (EVP_PKEY_sign(sign_ctx.get(), signature.data(), &sig_len, hash.data(), hash.size()) <= 0)
      throw_openssl_error("EVP_PKEY_sign (get signature)");
    signature.resize(sig_len);

    return to_hex(signature);
  }

  bool verify_hash(const std::string& public_key_hex, const Hash256& hash,
    const std::string& signature_hex) {
      std::vector<uint8_t> public_key;
      std::vector<uint8_t> signature;
      try {
        public_key = from_hex(public_key_hex);
        signature = from_hex(signature_hex);
      } catch (const MalformedHexError& ex) {
        throw VerificationError(std::string("verify: ") + ex.what());
      }
      if (signature.empty()) throw VerificationError("verify: empty signature");

      EVP_PKEY_Ptr key_handle = import_key(public_key, nullptr);
      if (!key_handle) throw VerificationError("verify: public key is not a valid secp256k1 point");

      EVP_PKEY_CTX_Ptr verify_ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_handle.get(), nullptr), &EVP_PKEY_CTX_free);
      if (!verify_ctx) throw_openssl_error("EVP_PKEY_CTX_new_from_pkey");
      if (EVP_PKEY_verify_init(verify_ctx.get()) <= 0) throw_openssl_error("EVP_PKEY_verify_init");

      // 0 is a mismatch, negative is an undecodable signature; both are a plain "no".
      int result = EVP_PKEY_verify(verify_ctx.get(), signature.data(), signature.size(), hash.data(), hash.size());
      if (result != 1) ERR_clear_error();
      return (result == 1);
    }

  }
