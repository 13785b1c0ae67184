#include "app.hpp"
#include "command_facade.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "tools/scoop.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <signal.h>

namespace {

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) {
    g_interrupted.store(true);
}

void print_help(const char* program_name) {
    printf("scoopdeck - Scoop package manager front-end\n\n");
    printf("Usage: %s [OPTIONS] <command> [package|query]\n\n", program_name);
    printf("Commands:\n");
    printf("  list              List installed packages\n");
    printf("  installed         Same as list, served from cache when possible\n");
    printf("  search <query>    Search buckets for packages\n");
    printf("  install <name>    Install a package\n");
    printf("  update <name>     Update a package (--all for every package)\n");
    printf("  uninstall <name>  Uninstall a package\n");
    printf("  cleanup <name>    Remove old versions of a package (--all for every package)\n\n");
    printf("Options:\n");
    printf("  -t, --tool <path>       Package manager executable (default: scoop)\n");
    printf("  -s, --shell <path>      Run the tool through this PowerShell\n");
    printf("      --powershell        Run the tool through pwsh/powershell from PATH\n");
    printf("      --timeout <ms>      Give up on a command after this long\n");
    printf("      --cache <n>         Number of searches kept in memory\n");
    printf("      --log-level <lvl>   trace, debug, info, warn, error, off\n");
    printf("      --log-file <path>   Rotating log file (empty to disable)\n");
    printf("  -a, --all               update/cleanup every installed package\n");
    printf("      --sort              Sort search results by relevance\n");
    printf("      --no-color          Disable colors\n");
    printf("  -h, --help              Show this help message\n");
    printf("  -v, --version           Show version\n\n");
    printf("Environment:\n");
    printf("  SCOOPDECK_TOOL, SCOOPDECK_SHELL, SCOOPDECK_TIMEOUT_MS, SCOOPDECK_LOG_LEVEL,\n");
    printf("  SCOOPDECK_LOG_FILE, SCOOPDECK_SEARCH_CACHE, NO_COLOR\n");
}

void print_version() {
    printf("scoopdeck version 0.3.0\n");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    scoopdeck::Config config;
    std::string error;

    if (!scoopdeck::apply_environment(config, error) ||
        !scoopdeck::parse_arguments(config, argc, argv, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return scoopdeck::App::EXIT_USAGE;
    }

    if (config.show_help) {
        print_help(argv[0]);
        return 0;
    }
    if (config.show_version) {
        print_version();
        return 0;
    }
    if (config.command.empty()) {
        print_help(argv[0]);
        return scoopdeck::App::EXIT_USAGE;
    }

    scoopdeck::init_logging(config);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_sigint;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0) {
        spdlog::warn("could not install SIGINT handler: {}", std::strerror(errno));
    }

    auto tool = std::make_unique<scoopdeck::ScoopTool>(config.tool, scoopdeck::resolve_shell(config));
    if (!tool->is_available()) {
        spdlog::warn("'{}' not found on PATH", tool->shell().empty() ? config.tool : tool->shell());
    }

    scoopdeck::FacadeOptions options;
    options.default_timeout = config.timeout;
    options.search_cache_size = config.search_cache_size;

    int exit_code = scoopdeck::App::EXIT_FAILED;
    {
        scoopdeck::CommandFacade facade(std::move(tool),
                                        std::make_unique<scoopdeck::PosixProcessRunner>(),
                                        options);
        scoopdeck::App app(config, facade, g_interrupted);
        exit_code = app.run();
    }

    spdlog::shutdown();
    return exit_code;
}
