#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace flakeid::cli {

// decode_ids writes one JSON object per input id to `out`.
// Unparseable inputs are reported to `err`; the remaining ids are still decoded.
// Returns 0 when every input decoded, 1 otherwise.
int decode_ids(const std::vector<std::string>& inputs, std::ostream& out, std::ostream& err);

}  // namespace flakeid::cli
