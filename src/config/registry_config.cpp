#include "config/registry_config.hpp"
#include <cstdlib>

namespace docreg {
namespace config {

RegistryConfig default_config() {
  RegistryConfig config;

  if (const char* store_dir = std::getenv(STORE_DIR_ENV); store_dir && *store_dir) {
    config.store_root = store_dir;
  }
  if (const char* level = std::getenv(LOG_LEVEL_ENV); level && *level) {
    config.log_level = logging::parse_severity(level);
  }

  return config;
}

} // namespace config
} // namespace docreg
