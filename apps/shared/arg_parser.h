#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flakeid::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure; a failure is
// recorded in ParsedArgs::errors and parsing continues with the next flag.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// errors holds one message per unknown flag, missing value or rejected value.
template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Non-flag tokens are collected as positionals in order.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      // "-1" and other negative numbers are values, not flags.
      const bool looks_like_flag =
          arg.size() > 1 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9');
      if (looks_like_flag) {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positionals.push_back(std::move(arg));
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid " + arg + ": " + value);
    }
  }

  return parsed;
}

// print_options writes one "  <name> <value>  <description>" line per option.
template <typename Config>
void print_options(std::ostream& os, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
       << "      " << opt.description << "\n";
  }
}

}  // namespace flakeid::apps
