#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace scoopdeck {

struct Config {
    // Tool
    std::string tool = "scoop";
    std::string shell;            // explicit PowerShell executable
    bool use_powershell = false;  // route through auto-detected PowerShell

    // Facade
    std::optional<std::chrono::milliseconds> timeout;
    std::size_t search_cache_size = 5;

    // Logging
    std::string log_level = "info";
    std::string log_file = "logs/app.log";  // empty disables the file sink

    // Display
    bool color = true;
    bool sort_results = false;

    // Requested action
    std::string command;
    std::string argument;
    bool all_packages = false;  // update/cleanup every installed package
    bool show_help = false;
    bool show_version = false;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// SCOOPDECK_TOOL, SCOOPDECK_SHELL, SCOOPDECK_TIMEOUT_MS, SCOOPDECK_LOG_LEVEL,
// SCOOPDECK_LOG_FILE, SCOOPDECK_SEARCH_CACHE and NO_COLOR.
bool apply_environment(Config& config, const EnvLookup& lookup, std::string& error);
bool apply_environment(Config& config, std::string& error);

// Options override the environment. Positionals are <command> [argument...].
bool parse_arguments(Config& config, int argc, const char* const argv[], std::string& error);

// Shell to route through, or empty to run the tool directly
std::string resolve_shell(const Config& config);

} // namespace scoopdeck
