#pragma once

#include "flakeid/id/snowflake_generator.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace flakeid::cli {

enum class OutputFormat {
  kDecimal,  // NOLINT(readability-identifier-naming)
  kHex,      // NOLINT(readability-identifier-naming)
  kJson,     // NOLINT(readability-identifier-naming)
};

// parse_output_format accepts "dec", "hex" or "json".
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text);

// write_ids generates `count` ids and writes one per line to `out` in the
// requested format (kJson writes the decoded fields as one JSON object per line).
// Stops at the first generation error, reports it to `err` and returns 1; returns 0 otherwise.
int write_ids(id::SnowflakeGenerator& generator, std::int64_t count, OutputFormat format,
              std::ostream& out, std::ostream& err);

}  // namespace flakeid::cli
