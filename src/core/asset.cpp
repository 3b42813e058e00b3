#include "tessera/core/asset.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/hash.hpp"

#include <string_view>

namespace tessera::core {

  namespace {
    void write_text(ByteWriter& writer, std::string_view text) {
      writer.write_raw(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

    void write_joined(ByteWriter& writer, const std::vector<std::string>& parts) {
      for (const auto& part : parts) write_text(writer, part);
    }
  }

  TransactionType asset_type(const Asset& asset) {
    return std::visit(overloaded{
      [](const TransferAsset&) { return TransactionType::Transfer; },
      [](const SecondSignatureAsset&) { return TransactionType::SecondSignature; },
      [](const DelegateAsset&) { return TransactionType::Delegate; },
      [](const VoteAsset&) { return TransactionType::Vote; },
      [](const MultiSignatureAsset&) { return TransactionType::MultiSignature; },
    }, asset);
  }

  std::optional<TransactionType> transaction_type_from(uint8_t value) {
    switch (static_cast<TransactionType>(value)) {
      case TransactionType::Transfer:
      case TransactionType::SecondSignature:
      case TransactionType::Delegate:
      case TransactionType::Vote:
      case TransactionType::MultiSignature:
        return static_cast<TransactionType>(value);
    }
    return std::nullopt;
  }

  const char* type_name(TransactionType type) {
    switch (type) {
      case TransactionType::Transfer: return "transfer";
      case TransactionType::SecondSignature: return "second-signature";
      case TransactionType::Delegate: return "delegate";
      case TransactionType::Vote: return "vote";
      case TransactionType::MultiSignature: return "multisignature";
    }
    return "unknown";
  }

  void encode_asset(ByteWriter& writer, uint8_t type, const Asset& asset) {
    auto known = transaction_type_from(type);
    if (!known) throw UnrecognizedTypeError("unrecognized transaction type " + std::to_string(type));
    if (*known != asset_type(asset))
      throw UnrecognizedTypeError(std::string("type ") + type_name(*known) + " does not match a " +
        type_name(asset_type(asset)) + " asset");

    std::visit(overloaded{
      [](const TransferAsset&) {},
      [&](const SecondSignatureAsset& second) {
        std::vector<uint8_t> public_key;
        try {
          public_key = from_hex(second.public_key);
        } catch (const MalformedHexError& ex) {
          throw MalformedKeyError(std::string("second signature public key: ") + ex.what());
        }
        writer.write_raw(public_key);
      },
      [&](const DelegateAsset& delegate) { write_text(writer, delegate.username); },
      [&](const VoteAsset& vote) { write_joined(writer, vote.votes); },
      [&](const MultiSignatureAsset& multi) {
        writer.write_u8(multi.min);
        writer.write_u8(multi.lifetime);
        write_joined(writer, multi.keysgroup);
      },
    }, asset);
  }
}
