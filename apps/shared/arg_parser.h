#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is rejected; the parser reports the
// flag and marks the whole parse as failed.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  bool ok{true};                         // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler and collects the remaining tokens as positionals.
// Unknown flags, missing values and rejected values are reported to stderr
// and clear ParsedArgs::ok; parsing continues so every problem is listed.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          if (!opt->handler(parsed.config, value)) {
            std::cerr << "Invalid value for " << arg << ": " << value << "\n";
            parsed.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// print_options writes one "  <name> [value]  <description>" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace wid::apps
