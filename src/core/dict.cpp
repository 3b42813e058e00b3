#include "tessera/core/dict.hpp"

#include <cstdio>
#include <sstream>

namespace tessera::core {

  namespace {
    void dump_string(const std::string& text, std::ostringstream& out) {
      out << '"';
      for (char c : text) {
        switch (c) {
          case '"': out << "\\\""; break;
          case '\\': out << "\\\\"; break;
          case '\n': out << "\\n"; break;
          case '\r': out << "\\r"; break;
          case '\t': out << "\\t"; break;
          default:
            if (static_cast<unsigned char>(c) < 0x20) {
              char escaped[8];
              std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(c));
              out << escaped;
            } else {
              out << c;
            }
        }
      }
      out << '"';
    }

    void dump(const Dict& dict, std::ostringstream& out);

    void dump(const DictValue& node, std::ostringstream& out) {
      if (std::holds_alternative<std::nullptr_t>(node.value)) out << "null";
      else if (std::holds_alternative<uint64_t>(node.value)) out << std::get<uint64_t>(node.value);
      else if (std::holds_alternative<std::string>(node.value)) dump_string(std::get<std::string>(node.value), out);
      else if (std::holds_alternative<DictArray>(node.value)) {
        const auto& items = std::get<DictArray>(node.value);
        out << '[';
        for (size_t i = 0; i < items.size(); ++i) {
          if (i) out << ',';
          dump(items[i], out);
        }
        out << ']';
      } else {
        dump(std::get<Dict>(node.value), out);
      }
    }

    void dump(const Dict& dict, std::ostringstream& out) {
      out << '{';
      for (size_t i = 0; i < dict.size(); ++i) {
        if (i) out << ',';
        dump_string(dict[i].first, out);
        out << ':';
        dump(dict[i].second, out);
      }
      out << '}';
    }
  }

  const DictValue* find(const Dict& dict, std::string_view key) {
    for (const auto& [name, value] : dict) {
      if (name == key) return &value;
    }
    return nullptr;
  }

  std::string to_json(const DictValue& value) {
    std::ostringstream out;
    dump(value, out);
    return out.str();
  }

  std::string to_json(const Dict& dict) {
    std::ostringstream out;
    dump(dict, out);
    return out.str();
  }
}
