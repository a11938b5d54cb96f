#include "flakeid/core/version.h"
#include "flakeid/id/id_json.h"

#include "commands/decode.h"
#include "commands/generate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
            << "Usage: flakeid_cli <command> [options]\n"
            << "Commands:\n"
            << "  generate   Print new ids\n"
            << "             [--node-id <n|auto>] [--count <n>] [--format dec|hex|json]\n"
            << "  decode     Decode ids into timestamp, node id and sequence\n"
            << "  layout     Print the bit layout as JSON\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 2;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "layout") {
    std::cout << flakeid::id::layout_to_json().dump(2) << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 2;
}
