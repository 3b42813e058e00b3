#include "tessera/core/builder.hpp"
#include "tessera/core/address.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/hash.hpp"
#include "tessera/core/keys.hpp"

namespace tessera::core {

  uint64_t default_fee(const FeeSchedule& fees, const Asset& asset) {
    switch (asset_type(asset)) {
      case TransactionType::Transfer: return fees.transfer;
      case TransactionType::SecondSignature: return fees.second_signature;
      case TransactionType::Delegate: return fees.delegate;
      case TransactionType::Vote: return fees.vote;
      case TransactionType::MultiSignature: {
        const auto& multi = std::get<MultiSignatureAsset>(asset);
        return (multi.keysgroup.size() + 1) * fees.multisignature;
      }
    }
    throw UnrecognizedTypeError("no fee for asset");
  }

  TransactionBuilder::TransactionBuilder(Asset asset, const std::string& secret, const NetworkConfig& config,
                                         TimeSource time_source) {
    if (!time_source) time_source = system_time_source(config);

    transaction_.type = static_cast<uint8_t>(asset_type(asset));
    transaction_.timestamp = time_source();
    transaction_.sender_public_key = derive_public_key(secret);
    transaction_.fee = default_fee(config.fees, asset);
    transaction_.asset = std::move(asset);
  }

  TransactionBuilder& TransactionBuilder::recipient(std::string address) {
    transaction_.recipient_id = std::move(address);
    return *this;
  }

  TransactionBuilder& TransactionBuilder::amount(uint64_t value) {
    transaction_.amount = value;
    return *this;
  }

  TransactionBuilder& TransactionBuilder::fee(uint64_t value) {
    transaction_.fee = value;
    return *this;
  }

  TransactionBuilder& TransactionBuilder::vendor_field_hex(std::string hex) {
    transaction_.vendor_field = std::move(hex);
    return *this;
  }

  TransactionBuilder& TransactionBuilder::vendor_field_text(std::string_view text) {
    transaction_.vendor_field = to_hex(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    return *this;
  }

  TransactionBuilder& TransactionBuilder::requester_public_key(std::string hex) {
    transaction_.requester_public_key = std::move(hex);
    return *this;
  }

  Transaction TransactionBuilder::build() const {
    Transaction transaction = transaction_;
    (void)transaction.to_bytes(true, true);
    return transaction;
  }

  Transaction TransactionBuilder::build_signed(const std::string& secret,
                                               const std::optional<std::string>& second_secret) const {
    Transaction transaction = build();
    transaction.sign(secret);
    if (second_secret) transaction.second_sign(*second_secret);
    return transaction;
  }

  TransactionBuilder transfer(const std::string& secret, std::string recipient_id, uint64_t amount,
                              const NetworkConfig& config, TimeSource time_source) {
    TransactionBuilder builder(TransferAsset{}, secret, config, std::move(time_source));
    builder.recipient(std::move(recipient_id)).amount(amount);
    return builder;
  }

  TransactionBuilder vote(const std::string& secret, std::vector<std::string> votes,
                          const NetworkConfig& config, TimeSource time_source) {
    if (votes.empty()) throw TransactionError("vote: at least one vote is required");
    for (const auto& entry : votes) {
      if (entry.empty() || (entry[0] != '+' && entry[0] != '-'))
        throw TransactionError("vote: entries must start with '+' or '-': " + entry);
    }
    TransactionBuilder builder(VoteAsset{std::move(votes)}, secret, config, std::move(time_source));
    builder.recipient(address_from_public_key(builder.peek().sender_public_key, config.address_version));
    return builder;
  }

  TransactionBuilder register_delegate(const std::string& secret, std::string username,
                                       const NetworkConfig& config, TimeSource time_source) {
    if (username.empty()) throw TransactionError("delegate: username must not be empty");
    return TransactionBuilder(DelegateAsset{std::move(username)}, secret, config, std::move(time_source));
  }

  TransactionBuilder register_second_signature(const std::string& secret, const std::string& second_secret,
                                               const NetworkConfig& config, TimeSource time_source) {
    return TransactionBuilder(SecondSignatureAsset{derive_public_key(second_secret)}, secret, config,
                              std::move(time_source));
  }

  TransactionBuilder register_multisignature(const std::string& secret, uint8_t min, uint8_t lifetime,
                                             std::vector<std::string> keysgroup,
                                             const NetworkConfig& config, TimeSource time_source) {
    if (keysgroup.empty()) throw TransactionError("multisignature: keysgroup must not be empty");
    if (min == 0 || min > keysgroup.size())
      throw TransactionError("multisignature: min must be between 1 and the keysgroup size");
    MultiSignatureAsset asset{.min = min, .lifetime = lifetime, .keysgroup = std::move(keysgroup)};
    return TransactionBuilder(std::move(asset), secret, config, std::move(time_source));
  }
}
