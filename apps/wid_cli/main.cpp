#include "commands/alloc.h"
#include "commands/generate.h"
#include "commands/inspect.h"
#include "commands/manifest.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr
      << "Usage:\n"
      << "  wid_cli next [--kind wid|hlc] [--node N] [--W n] [--Z n] [--time-unit sec|ms]\n"
      << "  wid_cli stream [--kind wid|hlc] [--node N] [--W n] [--Z n] [--time-unit sec|ms] "
         "[--count n]\n"
      << "  wid_cli validate <id> [--kind wid|hlc] [--W n] [--Z n] [--time-unit sec|ms]\n"
      << "  wid_cli parse <id> [--kind wid|hlc] [--W n] [--Z n] [--time-unit sec|ms] [--json]\n"
      << "  wid_cli healthcheck [--kind wid|hlc] [--node N] [--W n] [--Z n] "
         "[--time-unit sec|ms] [--json]\n"
      << "  wid_cli bench [--kind wid|hlc] [--node N] [--W n] [--Z n] [--time-unit sec|ms] "
         "[--count n]\n"
      << "  wid_cli alloc (--db <path> | --redis <uri>) [--kind wid|hlc] [--node N] [--W n] "
         "[--Z n] [--time-unit sec|ms] [--count n]\n"
      << "  wid_cli manifest pack|inspect|verify|unpack ...\n"
      << "\n"
      << "Defaults: --kind wid --W 4 --Z 6 --time-unit sec, node from $NODE or cpp.\n"
      << "stream --count 0 streams until interrupted.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "next") {
    return cmd_next(argc, argv);
  }
  if (subcommand == "stream") {
    return cmd_stream(argc, argv);
  }
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "parse") {
    return cmd_parse(argc, argv);
  }
  if (subcommand == "healthcheck") {
    return cmd_healthcheck(argc, argv);
  }
  if (subcommand == "bench") {
    return cmd_bench(argc, argv);
  }
  if (subcommand == "alloc") {
    return cmd_alloc(argc, argv);
  }
  if (subcommand == "manifest") {
    return cmd_manifest(argc, argv);
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
