#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::core {

  struct DictValue;
  using DictArray = std::vector<DictValue>;
  // Ordered key/value pairs; keeps insertion order for display.
  using Dict = std::vector<std::pair<std::string, DictValue>>;

  struct DictValue {
    std::variant<std::nullptr_t, uint64_t, std::string, DictArray, Dict> value = nullptr;

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
  };

  // nullptr when the key is missing.
  const DictValue* find(const Dict& dict, std::string_view key);

  std::string to_json(const DictValue& value);
  std::string to_json(const Dict& dict);
}
