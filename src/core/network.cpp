#include "tessera/core/network.hpp"
#include "tessera/core/errors.hpp"

#include <chrono>
#include <limits>

namespace tessera::core {

  namespace {
    // 2017-03-21T13:00:00Z
    constexpr uint64_t kGenesisEpoch = 1490101200ULL;

    uint64_t now_sec() {
      return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch()
        ).count()
      );
    }
  }

  NetworkConfig mainnet() {
    return NetworkConfig{.name = "mainnet", .epoch = kGenesisEpoch, .address_version = 0x19};
  }

  NetworkConfig testnet() {
    return NetworkConfig{.name = "testnet", .epoch = kGenesisEpoch, .address_version = 0x52};
  }

  NetworkConfig network_by_name(const std::string& name) {
    if (name == "mainnet") return mainnet();
    if (name == "testnet") return testnet();
    throw ConfigError("unknown network: " + name);
  }

  uint32_t epoch_time(const NetworkConfig& config, uint64_t unix_now) {
    if (unix_now < config.epoch) throw ConfigError("clock is behind the " + config.name + " epoch");
    const uint64_t elapsed = unix_now - config.epoch;
    if (elapsed > std::numeric_limits<uint32_t>::max()) throw ConfigError("timestamp overflows 32 bits");
    return static_cast<uint32_t>(elapsed);
  }

  uint32_t epoch_time(const NetworkConfig& config) {
    return epoch_time(config, now_sec());
  }

  TimeSource system_time_source(const NetworkConfig& config) {
    return [config]() { return epoch_time(config); };
  }

  TimeSource fixed_time_source(uint32_t timestamp) {
    return [timestamp]() { return timestamp; };
  }
}
