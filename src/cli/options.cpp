#include "cli/options.hpp"
#include <tessera/core/errors.hpp>

#include <limits>

namespace tessera::cli {

  using tessera::core::ConfigError;

  namespace {
    // Accepts both "--name=value" and "--name value".
    bool take_value(const std::string& arg, const char* name, int& i, int argc, const char* const* argv, std::string& out) {
      const std::string prefix = std::string(name) + "=";
      if (arg.rfind(prefix, 0) == 0) {
        out = arg.substr(prefix.size());
        return true;
      }
      if (arg == name && i + 1 < argc) {
        out = argv[++i];
        return true;
      }
      return false;
    }

    std::vector<std::string> split_csv(const std::string& csv) {
      std::vector<std::string> parts;
      std::string cur;
      for (char c : csv) {
        if (c == ',') { parts.push_back(cur); cur.clear(); }
        else { cur.push_back(c); }
      }
      if (!cur.empty()) parts.push_back(cur);
      return parts;
    }
  }

  uint64_t parse_unsigned(const std::string& flag, const std::string& text, uint64_t max) {
    if (text.empty()) throw ConfigError(flag + ": expected a number");
    for (char c : text) {
      if (c < '0' || c > '9') throw ConfigError(flag + ": not an unsigned decimal number: " + text);
    }
    uint64_t value = 0;
    for (char c : text) {
      const uint64_t digit = static_cast<uint64_t>(c - '0');
      if (value > (max - digit) / 10) throw ConfigError(flag + ": out of range: " + text);
      value = value * 10 + digit;
    }
    return value;
  }

  Options parse_options(int argc, const char* const* argv) {
    Options options;
    constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;
      if (take_value(arg, "--network", i, argc, argv, value)) {
        options.network = value;
      } else if (take_value(arg, "--secret", i, argc, argv, value)) {
        options.secret = value;
      } else if (take_value(arg, "--second-secret", i, argc, argv, value)) {
        options.second_secret = value;
      } else if (take_value(arg, "--new-secret", i, argc, argv, value)) {
        options.new_secret = value;
      } else if (take_value(arg, "--recipient", i, argc, argv, value)) {
        options.recipient = value;
      } else if (take_value(arg, "--vendor", i, argc, argv, value)) {
        options.vendor = value;
      } else if (take_value(arg, "--username", i, argc, argv, value)) {
        options.username = value;
      } else if (take_value(arg, "--votes", i, argc, argv, value)) {
        options.votes = split_csv(value);
      } else if (take_value(arg, "--amount", i, argc, argv, value)) {
        options.amount = parse_unsigned("--amount", value, kMaxU64);
      } else if (take_value(arg, "--fee", i, argc, argv, value)) {
        options.fee = parse_unsigned("--fee", value, kMaxU64);
      } else if (take_value(arg, "--timestamp", i, argc, argv, value)) {
        options.timestamp = static_cast<uint32_t>(
          parse_unsigned("--timestamp", value, std::numeric_limits<uint32_t>::max()));
      } else if (arg == "-h" || arg == "--help") {
        options.help = true;
        return options;
      } else {
        throw ConfigError("unknown option: " + arg);
      }
    }
    if (options.secret.empty()) throw ConfigError("--secret is required");
    return options;
  }
}
