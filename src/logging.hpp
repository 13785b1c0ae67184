#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace scoopdeck {

struct Config;

// trace, debug, info, warn, error, critical, off
bool is_valid_log_level(const std::string& level);

// Installs the default "scoopdeck" logger: colour stderr sink plus a rotating
// file sink (10 MB x 3) unless config.log_file is empty. A file sink that
// cannot be opened is reported and skipped.
std::shared_ptr<spdlog::logger> init_logging(const Config& config);

} // namespace scoopdeck
