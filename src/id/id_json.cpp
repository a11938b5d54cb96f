#include "flakeid/id/id_json.h"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::id {

std::optional<std::uint64_t> parse_id(const std::string_view text) {
  std::string_view digits = text;
  int base = 10;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
    base = 16;
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  std::uint64_t value = 0;
  const char* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), last, value, base);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string format_id_hex(const std::uint64_t id) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setfill('0') << std::setw(16) << id;
  return oss.str();
}

std::string format_iso8601_millis(const std::int64_t unix_millis) {
  // Floor division so pre-1970 values keep a non-negative millisecond part.
  const std::int64_t seconds =
      unix_millis >= 0 ? unix_millis / 1000 : (unix_millis - 999) / 1000;
  const std::int64_t millis = unix_millis - seconds * 1000;
  const auto time_t_value = static_cast<std::time_t>(seconds);

  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << millis << 'Z';
  return oss.str();
}

nlohmann::json id_to_json(const std::uint64_t id) {
  const IdParts parts = decompose(id);

  nlohmann::json j;
  j["id"] = std::to_string(id);
  j["hex"] = format_id_hex(id);
  j["timestamp"] = parts.timestamp;
  j["unix_millis"] = parts.unix_millis();
  j["issued_at"] = format_iso8601_millis(parts.unix_millis());
  j["node_id"] = parts.node_id;
  j["sequence"] = parts.sequence;
  return j;
}

nlohmann::json layout_to_json() {
  nlohmann::json j;
  j["total_bits"] = kTotalBits;
  j["timestamp_bits"] = kTimestampBits;
  j["node_bits"] = kNodeBits;
  j["sequence_bits"] = kSequenceBits;
  j["timestamp_shift"] = kTimestampShift;
  j["node_shift"] = kNodeShift;
  j["max_node_id"] = kMaxNodeId;
  j["max_sequence"] = kMaxSequence;
  j["custom_epoch_millis"] = kCustomEpochMillis;
  j["custom_epoch"] = format_iso8601_millis(kCustomEpochMillis);
  return j;
}

nlohmann::json node_id_resolution_to_json(const NodeIdResolution& resolution) {
  nlohmann::json j;
  j["node_id"] = resolution.node_id;
  j["source"] = std::string(to_string(resolution.source));
  if (!resolution.fingerprint.empty()) {
    j["fingerprint"] = resolution.fingerprint;
  }
  return j;
}

}  // namespace flakeid::id
