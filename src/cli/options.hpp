#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tessera::cli {

  struct Options {
    std::string network = "mainnet";
    std::string secret;
    std::optional<std::string> second_secret;
    std::optional<std::string> new_secret;
    std::optional<std::string> recipient;
    std::optional<std::string> vendor;
    std::optional<std::string> username;
    std::vector<std::string> votes;
    uint64_t amount = 0;
    std::optional<uint64_t> fee;
    std::optional<uint32_t> timestamp;
    bool help = false;
  };

  // Plain decimal digits only; no sign, no whitespace. Throws ConfigError
  // naming the flag when the text is not a number or exceeds max.
  uint64_t parse_unsigned(const std::string& flag, const std::string& text, uint64_t max);

  /**
   * Parse argv[2..] (argv[1] is the command). Accepts "--name value" and
   * "--name=value". Throws ConfigError on an unknown option, a bad number or
   * a missing --secret. Sets help and returns early on -h/--help.
   */
  Options parse_options(int argc, const char* const* argv);
}
