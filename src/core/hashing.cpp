#include "flakeid/core/hashing.h"

namespace flakeid::core {

// FNV-1a 64. Node ids auto-derived from hardware addresses are the low bits of
// this hash, so its output must never change between releases or platforms.
std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kPrime;
  }
  return hash;
}

// The full hash, shown next to a derived node id so two hosts that landed on
// the same node id can be told apart.
std::string stable_hash64_hex(const std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::uint64_t hash = stable_hash64(input);
  std::string hex(16, '0');
  for (auto it = hex.rbegin(); it != hex.rend(); ++it) {
    *it = kHexDigits[hash & 0x0F];
    hash >>= 4;
  }
  return hex;
}

}  // namespace flakeid::core
