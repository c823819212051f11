// File: src/apps/sr_node/main.cpp
#include <iostream>
#include <string>

#include "sr/apps/node_app.hpp"
#include "sr/core/util/config_loader.hpp"
#include "sr/core/util/logging.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "sr_node\n"
            << "  --config <path>\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? sr::kExitOk : sr::kExitConfigError;
  }

  auto cfg_r = sr::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return sr::kExitConfigError;
  }
  const sr::Config cfg = cfg_r.take_value();

  const sr::Status st_log = sr::init_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return sr::kExitConfigError;
  }

  sr::NodeOptions opts;
  opts.config_path = args.config_path;
  return sr::run_node(cfg, opts);
}
