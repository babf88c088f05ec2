#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

class WireWriter;
class WireReader;

// 128-bit identifier used for entities, clients, conversations and
// client handle types
struct Id {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;

  static Id generate();
  static constexpr Id nil() { return Id{}; }
  // Stable id derived from a declared name (same name -> same id everywhere)
  static Id from_name(std::string_view name);
  static std::optional<Id> parse(std::string_view text);

  bool is_nil() const { return hi == 0 && lo == 0; }
  std::string to_string() const;

  void encode(WireWriter &writer) const;
  static Id decode(WireReader &reader);

  friend bool operator==(const Id &a, const Id &b) {
    return a.hi == b.hi && a.lo == b.lo;
  }
  friend bool operator!=(const Id &a, const Id &b) { return !(a == b); }
  friend bool operator<(const Id &a, const Id &b) {
    return a.hi != b.hi ? a.hi < b.hi : a.lo < b.lo;
  }
};

using entity_id = Id;
using client_id = Id;
using conv_id = Id;
using handle_type_id = Id;

namespace std {
template <> struct hash<Id> {
  size_t operator()(const Id &id) const noexcept {
    return static_cast<size_t>(id.hi ^ (id.lo * 0x9e3779b97f4a7c15ULL));
  }
};
} // namespace std

// FNV-1a, used to turn declared names into routing keys
constexpr std::uint64_t fnv1a64(std::string_view text,
                                std::uint64_t basis = 0xcbf29ce484222325ULL) {
  std::uint64_t hash = basis;
  for (char c : text) {
    hash ^= static_cast<std::uint8_t>(c);
    hash *= 0x100000001b3ULL;
  }
  return hash;
}
