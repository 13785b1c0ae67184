#include "config.hpp"
#include "logging.hpp"
#include "tools/powershell.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <set>

namespace scoopdeck {

namespace {

bool parse_count(const std::string& text, long long min_value, long long& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value < min_value) {
        return false;
    }
    out = value;
    return true;
}

bool set_timeout(Config& config, const std::string& text, std::string& error) {
    long long ms = 0;
    if (!parse_count(text, 0, ms)) {
        error = "invalid timeout '" + text + "' (milliseconds expected)";
        return false;
    }
    if (ms == 0) {
        config.timeout.reset();
    } else {
        config.timeout = std::chrono::milliseconds(ms);
    }
    return true;
}

bool set_cache(Config& config, const std::string& text, std::string& error) {
    long long size = 0;
    if (!parse_count(text, 1, size)) {
        error = "invalid search cache size '" + text + "' (positive number expected)";
        return false;
    }
    config.search_cache_size = static_cast<std::size_t>(size);
    return true;
}

bool set_log_level(Config& config, const std::string& text, std::string& error) {
    if (!is_valid_log_level(text)) {
        error = "invalid log level '" + text + "'";
        return false;
    }
    config.log_level = text;
    return true;
}

bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) ||
           (long_name && std::strcmp(arg, long_name) == 0);
}

} // anonymous namespace

bool apply_environment(Config& config, const EnvLookup& lookup, std::string& error) {
    if (const char* tool = lookup("SCOOPDECK_TOOL"); tool && *tool) {
        config.tool = tool;
    }
    if (const char* shell = lookup("SCOOPDECK_SHELL"); shell && *shell) {
        config.shell = shell;
    }
    if (const char* timeout = lookup("SCOOPDECK_TIMEOUT_MS"); timeout && *timeout) {
        if (!set_timeout(config, timeout, error)) return false;
    }
    if (const char* level = lookup("SCOOPDECK_LOG_LEVEL"); level && *level) {
        if (!set_log_level(config, level, error)) return false;
    }
    if (const char* file = lookup("SCOOPDECK_LOG_FILE"); file) {
        config.log_file = file;
    }
    if (const char* cache = lookup("SCOOPDECK_SEARCH_CACHE"); cache && *cache) {
        if (!set_cache(config, cache, error)) return false;
    }
    if (const char* no_color = lookup("NO_COLOR"); no_color && *no_color) {
        config.color = false;
    }
    return true;
}

bool apply_environment(Config& config, std::string& error) {
    return apply_environment(config, [](const char* name) { return std::getenv(name); }, error);
}

bool parse_arguments(Config& config, int argc, const char* const argv[], std::string& error) {
    std::string query;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (is_option(arg, "-h", "--help")) {
            config.show_help = true;
        } else if (is_option(arg, "-v", "--version")) {
            config.show_version = true;
        } else if (is_option(arg, nullptr, "--powershell")) {
            config.use_powershell = true;
        } else if (is_option(arg, nullptr, "--sort")) {
            config.sort_results = true;
        } else if (is_option(arg, "-a", "--all")) {
            config.all_packages = true;
        } else if (is_option(arg, nullptr, "--no-color")) {
            config.color = false;
        } else if (is_option(arg, "-t", "--tool") ||
                   is_option(arg, "-s", "--shell") ||
                   is_option(arg, nullptr, "--timeout") ||
                   is_option(arg, nullptr, "--cache") ||
                   is_option(arg, nullptr, "--log-level") ||
                   is_option(arg, nullptr, "--log-file")) {
            if (!has_value) {
                error = std::string("option ") + arg + " needs a value";
                return false;
            }
            std::string value = argv[++i];

            if (is_option(arg, "-t", "--tool")) {
                config.tool = value;
            } else if (is_option(arg, "-s", "--shell")) {
                config.shell = value;
            } else if (is_option(arg, nullptr, "--timeout")) {
                if (!set_timeout(config, value, error)) return false;
            } else if (is_option(arg, nullptr, "--cache")) {
                if (!set_cache(config, value, error)) return false;
            } else if (is_option(arg, nullptr, "--log-level")) {
                if (!set_log_level(config, value, error)) return false;
            } else {
                config.log_file = value;
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            error = std::string("unknown option ") + arg;
            return false;
        } else if (config.command.empty()) {
            config.command = arg;
        } else {
            // Remaining words form the package name or search query
            if (!query.empty()) query += ' ';
            query += arg;
        }
    }

    static const std::set<std::string> commands = {
        "list", "installed", "search", "install", "update", "uninstall", "cleanup",
    };
    if (!config.command.empty() && commands.count(config.command) == 0) {
        error = "unknown command '" + config.command + "'";
        return false;
    }

    if (config.all_packages && !config.command.empty()) {
        if (config.command != "update" && config.command != "cleanup") {
            error = "--all only applies to update and cleanup";
            return false;
        }
        if (!query.empty()) {
            error = "--all does not take a package name";
            return false;
        }
    }

    config.argument = query;
    return true;
}

std::string resolve_shell(const Config& config) {
    if (!config.shell.empty()) return config.shell;
    if (config.use_powershell) return find_powershell_executable();
    return "";
}

} // namespace scoopdeck
