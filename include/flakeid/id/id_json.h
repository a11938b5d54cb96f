#pragma once

#include "flakeid/id/layout.h"
#include "flakeid/id/node_id.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::id {

/// Parse an identifier written in decimal or as 0x-prefixed hex.
/// Returns nullopt for empty input, stray characters or values above 2^64 - 1.
[[nodiscard]] std::optional<std::uint64_t> parse_id(std::string_view text);

/// Render an identifier as 0x-prefixed, zero-padded, 16-digit lowercase hex.
[[nodiscard]] std::string format_id_hex(std::uint64_t id);

/// Render Unix milliseconds as ISO 8601 UTC with millisecond precision
/// (e.g. 2018-01-01T00:00:00.000Z).
[[nodiscard]] std::string format_iso8601_millis(std::int64_t unix_millis);

/// Serialize the decoded fields of an identifier. The id itself is rendered as
/// a decimal string: JSON numbers lose precision above 2^53.
[[nodiscard]] nlohmann::json id_to_json(std::uint64_t id);

/// Serialize the fixed bit layout (field widths, shifts, limits, epoch).
[[nodiscard]] nlohmann::json layout_to_json();

/// Serialize how a node id was resolved.
[[nodiscard]] nlohmann::json node_id_resolution_to_json(const NodeIdResolution& resolution);

}  // namespace flakeid::id
