#include "manifest.h"

#include "wid/manifest/framing.h"
#include "wid/manifest/manifest.h"
#include "wid/manifest/synapse_file.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace mf = wid::manifest;

struct PackCliConfig {
  std::optional<std::string> id;                         // NOLINT(readability-identifier-naming)
  std::string node;                                      // NOLINT(readability-identifier-naming)
  std::string data_type{"unknown"};                      // NOLINT(readability-identifier-naming)
  nlohmann::json metadata = nlohmann::json::object();    // NOLINT(readability-identifier-naming)
  mf::FramingMode mode{mf::FramingMode::kEmbedded};      // NOLINT(readability-identifier-naming)
};

void print_usage() {
  std::cerr << "Usage:\n"
            << "  wid_cli manifest pack <payload> <out> --id <id> [--node N] [--data-type T]\n"
            << "                        [--meta key=value]... [--sidecar]\n"
            << "  wid_cli manifest inspect <file>\n"
            << "  wid_cli manifest verify <file>\n"
            << "  wid_cli manifest unpack <file> <out>\n";
}

int report(const mf::ManifestError& error) {
  std::cerr << "Error: " << error.message << "\n";
  return 1;
}

int run_pack(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<wid::apps::Option<PackCliConfig>> options = {
      {"--id", true, "Manifest id (e.g. a generated WID)",
       [](PackCliConfig& c, const std::string& v) {
         c.id = v;
         return !v.empty();
       }},
      {"--node", true, "Producing node name",
       [](PackCliConfig& c, const std::string& v) {
         c.node = v;
         return true;
       }},
      {"--data-type", true,
       "unknown | text/plain | application/json | application/octet-stream",
       [](PackCliConfig& c, const std::string& v) {
         if (!mf::parse_data_type(v).has_value()) {
           return false;
         }
         c.data_type = v;
         return true;
       }},
      {"--meta", true, "Free-form metadata entry key=value (repeatable)",
       [](PackCliConfig& c, const std::string& v) {
         const auto eq = v.find('=');
         if (eq == std::string::npos || eq == 0) {
           return false;
         }
         c.metadata[v.substr(0, eq)] = v.substr(eq + 1);
         return true;
       }},
      {"--sidecar", false, "Write payload plus <out>.manifest.json instead of one file",
       [](PackCliConfig& c, const std::string& /*v*/) {
         c.mode = mf::FramingMode::kSidecar;
         return true;
       }},
  };
  auto parsed = wid::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.size() != 2 || !parsed.config.id.has_value()) {
    print_usage();
    return 1;
  }

  auto payload = mf::read_file_bytes(parsed.positionals[0]);
  if (!payload.has_value()) {
    return report(payload.error());
  }

  mf::Manifest manifest;
  manifest.id = parsed.config.id.value();
  manifest.node = parsed.config.node;
  manifest.data_type = parsed.config.data_type;
  manifest.metadata = parsed.config.metadata;

  mf::SynapseFile file(std::move(manifest), std::move(payload.value()));
  auto saved = file.save(parsed.positionals[1], parsed.config.mode);
  if (!saved.has_value()) {
    return report(saved.error());
  }
  std::cout << file.manifest().data_hash << "\n";
  return 0;
}

// Loads the container named by the first positional; expected is the number of
// positionals the action takes.
std::optional<mf::SynapseFile> load_single(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                           const std::size_t expected,
                                           std::vector<std::string>& positionals) {
  const std::vector<wid::apps::Option<bool>> no_options;
  auto parsed = wid::apps::parse_options(argc, argv, no_options, 3, false);
  if (!parsed.ok || parsed.positionals.size() != expected) {
    print_usage();
    return std::nullopt;
  }
  positionals = parsed.positionals;
  auto loaded = mf::SynapseFile::load(parsed.positionals.front());
  if (!loaded.has_value()) {
    report(loaded.error());
    return std::nullopt;
  }
  return std::move(loaded.value());
}

}  // namespace

int cmd_manifest(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    print_usage();
    return 1;
  }
  const std::string action = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  std::vector<std::string> positionals;
  if (action == "pack") {
    return run_pack(argc, argv);
  }
  if (action == "inspect") {
    const auto file = load_single(argc, argv, 1, positionals);
    if (!file.has_value()) {
      return 1;
    }
    std::cout << file->manifest().to_json().dump(2) << "\n";
    return 0;
  }
  if (action == "verify") {
    const auto file = load_single(argc, argv, 1, positionals);
    if (!file.has_value()) {
      return 1;
    }
    const bool ok = file->verify();
    std::cout << (ok ? "true" : "false") << "\n";
    return ok ? 0 : 1;
  }
  if (action == "unpack") {
    const auto file = load_single(argc, argv, 2, positionals);
    if (!file.has_value()) {
      return 1;
    }
    auto written = mf::write_file_bytes(positionals[1], file->payload());
    if (!written.has_value()) {
      return report(written.error());
    }
    return 0;
  }

  std::cerr << "Unknown manifest action: " << action << "\n";
  print_usage();
  return 1;
}
