#include "config.h"

#include "shared/arg_parser.h"
#include <charconv>
#include <string>
#include <utility>
#include <vector>

namespace flakeid::server {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_node_id(ServerConfig& config, const std::string& value) {
  config.node_id = value;
  return true;
}

bool handle_max_batch(ServerConfig& config, const std::string& value) {
  std::int64_t parsed = 0;
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return false;
  }
  config.max_batch = parsed;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  return {
      {"--node-id", true, "Node id 0..1023, or 'auto' / -1 to derive from hardware addresses",
       handle_node_id},
      {"--max-batch", true, "Largest count accepted by one id/generate request (1..4096)",
       handle_max_batch},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

ServerConfig parse_args(int argc, char* argv[]) {
  auto parsed = apps::parse_options<ServerConfig>(argc, argv, build_option_registry());
  for (const auto& positional : parsed.positionals) {
    parsed.errors.push_back("Unexpected argument: " + positional);
  }
  parsed.config.arg_errors = std::move(parsed.errors);
  return parsed.config;
}

core::Result<id::NodeIdSetting, core::IdError> node_id_setting(const ServerConfig& config) {
  if (!config.node_id.has_value()) {
    return core::Result<id::NodeIdSetting, core::IdError>::ok(id::NodeIdSetting::automatic());
  }
  return id::parse_node_id_setting(config.node_id.value());
}

}  // namespace flakeid::server
