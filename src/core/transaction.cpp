#include "tessera/core/transaction.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/field_codec.hpp"
#include "tessera/core/serializer.hpp"
#include "tessera/core/keys.hpp"

namespace tessera::core {

  namespace {
    DictValue optional_string(const std::optional<std::string>& value) {
      if (!value) return DictValue{};
      return DictValue{*value};
    }

    DictValue string_list(const std::vector<std::string>& values) {
      DictArray items;
      items.reserve(values.size());
      for (const auto& value : values) items.push_back(DictValue{value});
      return DictValue{std::move(items)};
    }

    // Decode failures while rebuilding the signed digest are malformed
    // verification input.
    template <class F>
    Hash256 digest_for_verify(const char* context, F&& compute) {
      try {
        return compute();
      } catch (const MalformedKeyError& ex) {
        throw VerificationError(std::string(context) + ": " + ex.what());
      } catch (const MalformedHexError& ex) {
        throw VerificationError(std::string(context) + ": " + ex.what());
      }
    }
  }

  std::vector<uint8_t> Transaction::to_bytes(bool skip_signature, bool skip_second_signature) const {
    ByteWriter writer;

    codec::write_type(writer, type);
    codec::write_timestamp(writer, timestamp);

    codec::write_public_key(writer, sender_public_key);
    if (requester_public_key) {
      codec::write_public_key(writer, *requester_public_key);
    }

    codec::write_recipient(writer, recipient_id);
    codec::write_vendor_field(writer, vendor_field);

    codec::write_amount(writer, amount);
    codec::write_fee(writer, fee);

    encode_asset(writer, type, asset);

    if (!skip_signature) {
      codec::write_signature(writer, signature, "signature");
    }
    if (!skip_second_signature) {
      codec::write_signature(writer, second_signature, "second signature");
    }
    return writer.take();
  }

  Hash256 Transaction::hash(bool skip_signature, bool skip_second_signature) const {
    auto tx_bytes = to_bytes(skip_signature, skip_second_signature);
    return sha256(std::span<const uint8_t>(tx_bytes.data(), tx_bytes.size()));
  }

  std::string Transaction::get_id() const {
    auto tx_hash = hash(true, true);
    return to_hex(std::span<const uint8_t>(tx_hash.data(), tx_hash.size()));
  }

  Hash256 Transaction::signing_hash() const {
    return hash(true, true);
  }

  Hash256 Transaction::second_signing_hash() const {
    return hash(false, true);
  }

  void Transaction::sign(const std::string& secret) {
    auto key_pair = derive_keypair(secret);
    auto digest = signing_hash();
    signature = sign_hash(key_pair, digest);
    // A second signature covers the previous first signature and is stale now.
    second_signature.reset();
    id = get_id();
  }

  void Transaction::second_sign(const std::string& secret) {
    auto key_pair = derive_keypair(secret);
    second_signature = sign_hash(key_pair, second_signing_hash());
    id = get_id();
  }

  bool Transaction::verify() const {
    if (!signature) throw VerificationError("verify: transaction has no signature");
    auto digest = digest_for_verify("verify", [this]() { return signing_hash(); });
    return verify_hash(sender_public_key, digest, *signature);
  }

  bool Transaction::second_verify() const {
    return second_verify(sender_public_key);
  }

  bool Transaction::second_verify(const std::string& second_public_key) const {
    if (!second_signature) throw VerificationError("second_verify: transaction has no second signature");
    if (!signature) throw VerificationError("second_verify: transaction has no first signature");
    auto digest = digest_for_verify("second_verify", [this]() { return second_signing_hash(); });
    return verify_hash(second_public_key, digest, *second_signature);
  }

  Dict Transaction::to_dict() const {
    Dict dict;
    dict.emplace_back("type", DictValue{static_cast<uint64_t>(type)});
    dict.emplace_back("amount", DictValue{amount});
    dict.emplace_back("fee", fee ? DictValue{*fee} : DictValue{});
    dict.emplace_back("asset", DictValue{asset_to_dict(asset)});
    dict.emplace_back("id", optional_string(id));
    dict.emplace_back("recipientId", optional_string(recipient_id));
    dict.emplace_back("vendorField", optional_string(vendor_field));
    dict.emplace_back("timestamp", DictValue{static_cast<uint64_t>(timestamp)});
    dict.emplace_back("senderPublicKey", DictValue{sender_public_key});
    dict.emplace_back("requesterPublicKey", optional_string(requester_public_key));
    dict.emplace_back("signature", optional_string(signature));
    dict.emplace_back("secondSignature", optional_string(second_signature));
    return dict;
  }

  Dict asset_to_dict(const Asset& asset) {
    return std::visit(overloaded{
      [](const TransferAsset&) { return Dict{}; },
      [](const SecondSignatureAsset& second) {
        Dict inner{{"publicKey", DictValue{second.public_key}}};
        return Dict{{"signature", DictValue{std::move(inner)}}};
      },
      [](const DelegateAsset& delegate) {
        Dict inner{{"username", DictValue{delegate.username}}};
        return Dict{{"delegate", DictValue{std::move(inner)}}};
      },
      [](const VoteAsset& vote) {
        return Dict{{"votes", string_list(vote.votes)}};
      },
      [](const MultiSignatureAsset& multi) {
        Dict inner{
          {"min", DictValue{static_cast<uint64_t>(multi.min)}},
          {"lifetime", DictValue{static_cast<uint64_t>(multi.lifetime)}},
          {"keysgroup", string_list(multi.keysgroup)},
        };
        return Dict{{"multisignature", DictValue{std::move(inner)}}};
      },
    }, asset);
  }
}
