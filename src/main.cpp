#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <tessera/core/address.hpp>
#include <tessera/core/builder.hpp>
#include <tessera/core/errors.hpp>
#include <tessera/core/field_codec.hpp>
#include <tessera/core/keys.hpp>
#include <tessera/core/network.hpp>
#include <tessera/core/serializer.hpp>
#include <tessera/core/transaction.hpp>

#include "cli/options.hpp"

using namespace tessera::core;
using tessera::cli::Options;
using tessera::cli::parse_options;

static void print_usage() {
  std::printf(
    "Tessera Transaction CLI\n\n"
    "Usage:\n"
    "  tessera-cli keys             --secret S [--network NAME]\n"
    "  tessera-cli transfer         --secret S --recipient ADDR --amount N [common]\n"
    "  tessera-cli vote             --secret S --votes CSV [common]\n"
    "  tessera-cli delegate         --secret S --username NAME [common]\n"
    "  tessera-cli second-signature --secret S --new-secret S2 [common]\n"
    "  tessera-cli inspect          --secret S [--recipient ADDR] [--amount N] [common]\n\n"
    "Common options:\n"
    "  --network        mainnet | testnet (default: mainnet)\n"
    "  --second-secret  Second passphrase; adds a second signature\n"
    "  --fee            Fee override (default: network fee for the type)\n"
    "  --vendor         Vendor field text (at most 64 bytes)\n"
    "  --timestamp      Epoch timestamp override (default: now)\n"
  );
}

namespace {

  TimeSource time_source_for(const Options& options, const NetworkConfig& config) {
    if (options.timestamp) return fixed_time_source(*options.timestamp);
    return system_time_source(config);
  }

  void apply_common(TransactionBuilder& builder, const Options& options) {
    if (options.fee) builder.fee(*options.fee);
    if (options.vendor) builder.vendor_field_text(*options.vendor);
  }

  void print_transaction(const Transaction& tx) {
    std::cout << to_json(tx.to_dict()) << "\n";
    std::cout << "bytes.len: " << tx.to_bytes(false, !tx.second_signature.has_value()).size() << "\n";
    std::cout << "verify: " << (tx.verify() ? "OK" : "FAIL") << "\n";
  }

  void print_layout(const Transaction& tx) {
    auto tx_bytes = tx.to_bytes(true, true);
    ByteReader reader(tx_bytes);
    auto field = [&](const char* name, size_t width) {
      std::cout << "  " << name << " @" << reader.position() << " +" << width << "\n";
      reader.skip(width);
    };

    std::cout << "layout (" << tx_bytes.size() << " bytes, unsigned):\n";
    field("type", codec::kTypeWidth);
    field("timestamp", codec::kTimestampWidth);
    field("senderPublicKey", tx.sender_public_key.size() / 2);
    if (tx.requester_public_key) field("requesterPublicKey", tx.requester_public_key->size() / 2);
    field("recipient", codec::kRecipientWidth);
    field("vendorField", codec::kVendorFieldWidth);
    field("amount", codec::kAmountWidth);
    field("fee", codec::kFeeWidth);
    field("asset", reader.remaining_bytes());
    std::cout << "id: " << tx.get_id() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 0;
  }

  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  Options options;
  try {
    options = parse_options(argc, argv);
  } catch (const ConfigError& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    print_usage();
    return 1;
  }
  if (options.help) {
    print_usage();
    return 0;
  }

  if (!crypto_init()) {
    std::fprintf(stderr, "crypto_init failed\n");
    return 1;
  }

  try {
    const auto config = network_by_name(options.network);
    auto time_source = time_source_for(options, config);

    if (command == "keys") {
      auto public_key = derive_public_key(options.secret);
      std::cout << "network: " << config.name << "\n";
      std::cout << "publicKey: " << public_key << "\n";
      std::cout << "address: " << address_from_public_key(public_key, config.address_version) << "\n";
      return 0;
    }

    std::optional<TransactionBuilder> builder;
    if (command == "transfer" || command == "inspect") {
      if (command == "transfer" && !options.recipient) {
        std::fprintf(stderr, "--recipient is required\n");
        return 1;
      }
      builder.emplace(TransferAsset{}, options.secret, config, time_source);
      if (options.recipient) builder->recipient(*options.recipient);
      builder->amount(options.amount);
    } else if (command == "vote") {
      builder.emplace(vote(options.secret, options.votes, config, time_source));
    } else if (command == "delegate") {
      if (!options.username) {
        std::fprintf(stderr, "--username is required\n");
        return 1;
      }
      builder.emplace(register_delegate(options.secret, *options.username, config, time_source));
    } else if (command == "second-signature") {
      if (!options.new_secret) {
        std::fprintf(stderr, "--new-secret is required\n");
        return 1;
      }
      builder.emplace(register_second_signature(options.secret, *options.new_secret, config, time_source));
    } else {
      std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
      print_usage();
      return 1;
    }

    apply_common(*builder, options);

    if (command == "inspect") {
      print_layout(builder->build());
      return 0;
    }

    auto tx = builder->build_signed(options.secret, options.second_secret);
    print_transaction(tx);
    if (options.second_secret) {
      auto second_public_key = derive_public_key(*options.second_secret);
      std::cout << "second_verify: " << (tx.second_verify(second_public_key) ? "OK" : "FAIL") << "\n";
    }
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }
  return 0;
}
