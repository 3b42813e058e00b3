#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <tessera/core/serializer.hpp>

namespace tessera::core {

  // Visitor built from lambdas, for std::visit over Asset.
  template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
  template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

  enum class TransactionType : uint8_t {
    Transfer = 0,
    SecondSignature = 1,
    Delegate = 2,
    Vote = 3,
    MultiSignature = 4,
  };

  struct TransferAsset {};

  struct SecondSignatureAsset {
    std::string public_key;  // hex
  };

  struct DelegateAsset {
    std::string username;
  };

  struct VoteAsset {
    std::vector<std::string> votes;  // "+<pubkey hex>" or "-<pubkey hex>"
  };

  struct MultiSignatureAsset {
    uint8_t min = 0;
    uint8_t lifetime = 0;
    std::vector<std::string> keysgroup;
  };

  using Asset = std::variant<TransferAsset, SecondSignatureAsset, DelegateAsset, VoteAsset, MultiSignatureAsset>;

  TransactionType asset_type(const Asset& asset);
  std::optional<TransactionType> transaction_type_from(uint8_t value);
  const char* type_name(TransactionType type);

  /**
   * Append the type-specific bytes that follow the fee field.
   * Only appends to writer. Throws UnrecognizedTypeError if type is not a
   * known TransactionType or disagrees with the asset held.
   */
  void encode_asset(ByteWriter& writer, uint8_t type, const Asset& asset);
}
