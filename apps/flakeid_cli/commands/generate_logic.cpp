#include "generate_logic.h"

#include "flakeid/id/id_json.h"

#include <string>

namespace flakeid::cli {

std::optional<OutputFormat> parse_output_format(const std::string_view text) {
  if (text == "dec") {
    return OutputFormat::kDecimal;
  }
  if (text == "hex") {
    return OutputFormat::kHex;
  }
  if (text == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

int write_ids(id::SnowflakeGenerator& generator, const std::int64_t count,
              const OutputFormat format, std::ostream& out, std::ostream& err) {
  for (std::int64_t i = 0; i < count; ++i) {
    const auto generated = generator.generate();
    if (!generated.has_value()) {
      err << "Error: id generation failed after " << i
          << " ids: " << core::to_string(generated.error()) << "\n";
      return 1;
    }

    switch (format) {
      case OutputFormat::kDecimal:
        out << generated.value() << "\n";
        break;
      case OutputFormat::kHex:
        out << id::format_id_hex(generated.value()) << "\n";
        break;
      case OutputFormat::kJson:
        out << id::id_to_json(generated.value()).dump() << "\n";
        break;
    }
  }
  return 0;
}

}  // namespace flakeid::cli
