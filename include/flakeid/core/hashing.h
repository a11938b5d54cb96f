#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace flakeid::core {

// Deterministic, platform-independent 64-bit string hash (FNV-1a).
[[nodiscard]] std::uint64_t stable_hash64(std::string_view input);

// stable_hash64 as 16 lowercase hex digits; used as the node-id fingerprint.
[[nodiscard]] std::string stable_hash64_hex(std::string_view input);

}  // namespace flakeid::core
