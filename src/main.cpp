#include "cli/cli.hpp"
#include "config/registry_config.hpp"
#include "logger/logger.hpp"
#include "registry/integrity_verifier.hpp"
#include "registry/lookup_engine.hpp"
#include "registry/registration_service.hpp"
#include "store/file_record_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  docreg::config::RegistryConfig config;
  bool quiet{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-d <store dir>] [-l <log file>] [-v | -q]\n"
        << "Optional arguments:\n"
        << "  -d, --dir      Registry store directory (default ./output, env DOCREG_STORE_DIR)\n"
        << "  -l, --log      Log file (default docreg.log)\n"
        << "  -v, --verbose  Log debug output to the console\n"
        << "  -q, --quiet    Disable logging\n"
        << "Example: " << program_name << " -d /var/lib/docreg -l /var/log/docreg.log\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {"-d", "--dir", "-l", "--log"};

  ProgramOptions options;
  options.config = docreg::config::default_config();

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.config.console_log = true;
      options.config.log_level = docreg::logging::severity::debug;
      continue;
    }

    if (flag == "-q" || flag == "--quiet") {
      options.quiet = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-d" || flag == "--dir") {
      options.config.store_root = value;
    } else {
      options.config.log_file = value;
    }
  }

  if (options.config.store_root.empty()) {
    std::cerr << "Error: Store directory cannot be empty\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_registry(const docreg::config::RegistryConfig& config, bool quiet) {
  try {
    if (config.console_log) {
      docreg::logging::init_console_logging(config.log_level);
    } else {
      docreg::logging::init_logging(config.log_file, config.log_level);
    }
    LOG_INFO << "Main: Store root " << config.store_root
             << ", " << config.verifier_threads << " verifier threads";
    if (quiet) {
      docreg::logging::disable_logging();
    }

    docreg::store::FileRecordStore store(config.store_root);
    docreg::registry::RegistrationService registration(store);
    docreg::registry::LookupEngine lookup(store);
    docreg::registry::IntegrityVerifier verifier(lookup, config.verifier_threads);
    docreg::cli::CLI cli(registration, lookup, verifier);

    std::cout << "Document registry at " << store.root().string() << "\n"
              << "Type 'help' for a list of commands.\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    LOG_FATAL << "Main: Failed to start registry: " << e.what();
    std::cerr << "Error: Failed to start registry: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_registry(options.config, options.quiet)) {
    return 1;
  }
  return 0;
}
