#include "decode.h"

#include "decode_logic.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_decode(int argc, char* argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: flakeid_cli decode <id> [<id>...]\n";
    return 2;
  }

  std::vector<std::string> inputs;
  for (int i = 2; i < argc; ++i) {
    inputs.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return flakeid::cli::decode_ids(inputs, std::cout, std::cerr);
}
