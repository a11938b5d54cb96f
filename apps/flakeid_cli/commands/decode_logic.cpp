#include "decode_logic.h"

#include "flakeid/id/id_json.h"

namespace flakeid::cli {

int decode_ids(const std::vector<std::string>& inputs, std::ostream& out, std::ostream& err) {
  int status = 0;
  for (const auto& input : inputs) {
    const auto parsed = id::parse_id(input);
    if (!parsed.has_value()) {
      err << "Error: not an id: '" << input << "' (expected decimal or 0x hex)\n";
      status = 1;
      continue;
    }
    out << id::id_to_json(parsed.value()).dump() << "\n";
  }
  return status;
}

}  // namespace flakeid::cli
