#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tessera::core {

  struct FeeSchedule {
    uint64_t transfer = 10'000'000;
    uint64_t second_signature = 500'000'000;
    uint64_t delegate = 2'500'000'000;
    uint64_t vote = 100'000'000;
    // Charged once per keysgroup member plus once for the sender.
    uint64_t multisignature = 500'000'000;
  };

  struct NetworkConfig {
    std::string name;
    uint64_t epoch = 0;  // unix seconds of the network's genesis
    uint8_t address_version = 0;
    FeeSchedule fees{};
  };

  NetworkConfig mainnet();
  NetworkConfig testnet();

  // Throws ConfigError for an unknown name.
  NetworkConfig network_by_name(const std::string& name);

  using TimeSource = std::function<uint32_t()>;

  // Seconds elapsed since the network epoch. Throws ConfigError if unix_now
  // predates the epoch or does not fit the 32-bit timestamp field.
  uint32_t epoch_time(const NetworkConfig& config, uint64_t unix_now);
  uint32_t epoch_time(const NetworkConfig& config);

  TimeSource system_time_source(const NetworkConfig& config);
  TimeSource fixed_time_source(uint32_t timestamp);
}
