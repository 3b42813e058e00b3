#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/core/asset.hpp>
#include <tessera/core/network.hpp>
#include <tessera/core/transaction.hpp>

namespace tessera::core {

  uint64_t default_fee(const FeeSchedule& fees, const Asset& asset);

  /**
   * Collects the fields of a transaction and hands out a validated value.
   * The sender key is derived from the secret and the timestamp taken from
   * time_source exactly once, in the constructor. The secret is not kept.
   * An empty time_source means the wall clock of config.
   */
  class TransactionBuilder {
    public:
      TransactionBuilder(Asset asset, const std::string& secret, const NetworkConfig& config,
                         TimeSource time_source = {});

      TransactionBuilder& recipient(std::string address);
      TransactionBuilder& amount(uint64_t value);
      TransactionBuilder& fee(uint64_t value);
      TransactionBuilder& vendor_field_hex(std::string hex);
      TransactionBuilder& vendor_field_text(std::string_view text);
      TransactionBuilder& requester_public_key(std::string hex);

      const Transaction& peek() const { return transaction_; }

      // Encodes once so every decode or width error surfaces here.
      Transaction build() const;

      Transaction build_signed(const std::string& secret,
                               const std::optional<std::string>& second_secret = std::nullopt) const;

    private:
      Transaction transaction_;
  };

  TransactionBuilder transfer(const std::string& secret, std::string recipient_id, uint64_t amount,
                              const NetworkConfig& config, TimeSource time_source = {});

  // Votes are "+<public key hex>" or "-<public key hex>". The recipient is the
  // sender's own address.
  TransactionBuilder vote(const std::string& secret, std::vector<std::string> votes,
                          const NetworkConfig& config, TimeSource time_source = {});

  TransactionBuilder register_delegate(const std::string& secret, std::string username,
                                       const NetworkConfig& config, TimeSource time_source = {});

  TransactionBuilder register_second_signature(const std::string& secret, const std::string& second_secret,
                                               const NetworkConfig& config, TimeSource time_source = {});

  TransactionBuilder register_multisignature(const std::string& secret, uint8_t min, uint8_t lifetime,
                                             std::vector<std::string> keysgroup,
                                             const NetworkConfig& config, TimeSource time_source = {});
}
