#include "generate.h"

#include "flakeid/core/clock.h"
#include "flakeid/id/entropy.h"
#include "flakeid/id/network_interfaces.h"
#include "flakeid/id/node_id.h"
#include "flakeid/id/snowflake_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <charconv>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::string node_id{"auto"};
  std::int64_t count{1};
  flakeid::cli::OutputFormat format{flakeid::cli::OutputFormat::kDecimal};
};

std::vector<flakeid::apps::Option<GenerateCliConfig>> generate_options() {
  return {
      {"--node-id", true, "Node id 0..1023, or 'auto' / -1 (default: auto)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.node_id = v;
         return true;
       }},
      {"--count", true, "Number of ids to print (default: 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         std::int64_t n = 0;
         const char* last = v.data() + v.size();
         const auto [ptr, ec] = std::from_chars(v.data(), last, n);
         if (v.empty() || ec != std::errc{} || ptr != last || n < 1) {
           return false;
         }
         c.count = n;
         return true;
       }},
      {"--format", true, "Output format: dec, hex or json (default: dec)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto format = flakeid::cli::parse_output_format(v);
         if (!format.has_value()) {
           return false;
         }
         c.format = format.value();
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {
  const auto options = generate_options();
  const auto parsed = flakeid::apps::parse_options<GenerateCliConfig>(argc, argv, options, 2);
  if (!parsed.ok() || !parsed.positionals.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << "Usage: flakeid_cli generate [options]\n";
    flakeid::apps::print_options(std::cerr, options);
    return 2;
  }
  const auto& config = parsed.config;

  const auto setting = flakeid::id::parse_node_id_setting(config.node_id);
  if (!setting.has_value()) {
    std::cerr << "Error: --node-id must be auto, -1 or an integer in 0..1023\n";
    return 2;
  }

  flakeid::core::SystemClock clock;
  flakeid::id::SystemNetworkInterfaceSource interfaces;
  flakeid::id::SystemEntropySource entropy;
  flakeid::id::NodeIdResolver resolver(interfaces, entropy);

  try {
    auto created = flakeid::id::SnowflakeGenerator::create(setting.value(), clock, resolver);
    if (!created.has_value()) {
      std::cerr << "Error: --node-id must be between 0 and 1023 ("
                << flakeid::core::to_string(created.error()) << ")\n";
      return 2;
    }
    return flakeid::cli::write_ids(*created.value(), config.count, config.format, std::cout,
                                   std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: failed to derive node id: " << e.what() << "\n";
    return 1;
  }
}
