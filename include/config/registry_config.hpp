#ifndef DOCREG_CONFIG_REGISTRY_CONFIG_HPP
#define DOCREG_CONFIG_REGISTRY_CONFIG_HPP

#include <cstddef>
#include <string>
#include "logger/logger.hpp"

namespace docreg {
namespace config {

constexpr const char* STORE_DIR_ENV = "DOCREG_STORE_DIR";
constexpr const char* LOG_LEVEL_ENV = "DOCREG_LOG_LEVEL";

struct RegistryConfig {
  // Directory holding one sub-directory per owner namespace
  std::string store_root = "./output";
  std::string log_file = "docreg.log";
  logging::severity log_level = logging::severity::info;
  bool console_log = false;
  // Worker threads used by the integrity verifier for offloaded hashing
  std::size_t verifier_threads = 2;
};

// Defaults overridden by DOCREG_STORE_DIR and DOCREG_LOG_LEVEL when set
RegistryConfig default_config();

} // namespace config
} // namespace docreg

#endif // DOCREG_CONFIG_REGISTRY_CONFIG_HPP
