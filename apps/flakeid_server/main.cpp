#include "flakeid/core/clock.h"
#include "flakeid/core/version.h"
#include "flakeid/id/entropy.h"
#include "flakeid/id/generator_slot.h"
#include "flakeid/id/network_interfaces.h"
#include "flakeid/id/node_id.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <string>

using namespace flakeid;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = server::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  core::SystemClock clock;
  id::SystemNetworkInterfaceSource interfaces;
  id::SystemEntropySource entropy;
  id::NodeIdResolver resolver(interfaces, entropy);

  // The process owns exactly one slot, so exactly one node-id assignment.
  id::GeneratorSlot slot(clock, resolver);

  const auto setting = server::node_id_setting(config);
  id::SnowflakeGenerator* generator = nullptr;
  try {
    const auto installed = slot.create(setting.value());
    if (!installed.has_value()) {
      std::cerr << "Error: failed to create generator: " << core::to_string(installed.error())
                << "\n";
      return 1;
    }
    generator = installed.value();
  } catch (const std::exception& e) {
    // std::random_device may throw when no entropy source is available.
    std::cerr << "Error: failed to derive node id: " << e.what() << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  const auto& resolution = generator->node_id_resolution();
  std::cerr << "flakeid server v" << core::kBuildVersion << "\n";
  std::cerr << "Node id:     " << resolution.node_id << " (" << id::to_string(resolution.source)
            << ")\n";
  if (resolution.source == id::NodeIdSource::kRandom) {
    std::cerr << "WARNING: Network interfaces could not be listed. Node id was chosen at RANDOM.\n"
                 "         Two processes may pick the same node id and issue duplicate ids.\n"
                 "         Pass --node-id <0..1023> to assign one explicitly.\n";
  } else if (resolution.source == id::NodeIdSource::kHardwareAddress) {
    std::cerr << "             derived from hardware addresses, fingerprint "
              << resolution.fingerprint << "\n";
  }
  std::cerr << "Max batch:   " << config.max_batch << "\n";
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  server::ServerContext ctx{*generator, config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
