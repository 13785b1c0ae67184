#include "app.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace scoopdeck {

App::App(const Config& config, CommandFacade& facade, const std::atomic<bool>& interrupted)
    : config_(config),
      facade_(facade),
      interrupted_(interrupted),
      terminal_(config.color) {
}

int App::run() {
    CommandHandle handle = dispatch();
    if (!handle.valid()) {
        terminal_.write_error_line("Error: unknown command '" + config_.command + "'");
        return EXIT_USAGE;
    }

    CommandResult result = await(handle);

    if (result.status == CommandStatus::Cancelled) {
        terminal_.write_error_line(describe(ErrorKind::Cancelled));
        return interrupted_.load() ? EXIT_INTERRUPTED : EXIT_FAILED;
    }

    if (!result.ok()) {
        draw_failure(result);
        return result.error == ErrorKind::InvalidArgument ? EXIT_USAGE : EXIT_FAILED;
    }

    CommandKind kind = result.request.kind;
    if (kind == CommandKind::List || kind == CommandKind::Search) {
        PackageList packages = result.packages;
        if (kind == CommandKind::Search && config_.sort_results) {
            sort_by_relevance(packages, result.request.argument);
        }
        draw_packages(packages, kind == CommandKind::Search);
    }

    terminal_.write_line(terminal_.style(Terminal::GREEN) + status_message(result) +
                         terminal_.style(Terminal::RESET));
    terminal_.flush();
    return EXIT_OK;
}

CommandHandle App::dispatch() {
    CommandOptions options;
    options.on_line = [this](OutputStream stream, const std::string& line) {
        on_progress(stream, line);
    };

    const std::string& cmd = config_.command;
    const std::string& arg = config_.argument;

    if (cmd == "list") return facade_.list_installed(options);
    if (cmd == "installed") return facade_.get_installed(options);
    if (cmd == "search") return facade_.search(arg, options);
    if (cmd == "install") return facade_.install(arg, options);
    if (cmd == "update" && config_.all_packages) return facade_.update_all(options);
    if (cmd == "cleanup" && config_.all_packages) return facade_.cleanup_all(options);
    if (cmd == "update") return facade_.update(arg, options);
    if (cmd == "uninstall") return facade_.uninstall(arg, options);
    if (cmd == "cleanup") return facade_.cleanup(arg, options);
    return CommandHandle{};
}

CommandResult App::await(const CommandHandle& handle) {
    auto future = handle.result();
    bool cancel_sent = false;

    while (future.wait_for(std::chrono::milliseconds(WAIT_SLICE_MS)) !=
           std::future_status::ready) {
        if (interrupted_.load() && !cancel_sent) {
            terminal_.write_error_line("Cancelling...");
            handle.cancel();
            cancel_sent = true;
        }
    }
    return future.get();
}

void App::on_progress(OutputStream stream, const std::string& line) {
    // Listing output is the table itself; only show what mutating commands print
    if (config_.command == "list" || config_.command == "installed" ||
        config_.command == "search") {
        if (stream == OutputStream::Stderr) {
            terminal_.write_error_line(line);
        }
        return;
    }

    if (stream == OutputStream::Stderr) {
        terminal_.write_line(terminal_.style(Terminal::YELLOW) + line +
                             terminal_.style(Terminal::RESET));
    } else {
        terminal_.write_line(terminal_.style(Terminal::DIM) + line +
                             terminal_.style(Terminal::RESET));
    }
    terminal_.flush();
}

void App::draw_packages(const PackageList& packages, bool search) {
    size_t source_width = 0;
    size_t name_width = 0;
    size_t version_width = 0;
    for (const auto& pkg : packages) {
        source_width = std::max(source_width, pkg.source.size() + 2);
        name_width = std::max(name_width, pkg.name.size());
        version_width = std::max(version_width, pkg.version.size());
    }

    std::ostringstream output;
    for (const auto& pkg : packages) {
        std::string tag = "[" + (pkg.source.empty() ? std::string("?") : pkg.source) + "]";

        // Source tag with color
        output << terminal_.style(facade_.tool().source_color(pkg.source)) << tag
               << terminal_.style(Terminal::RESET)
               << std::string(source_width + 1 - std::min(source_width, tag.size()), ' ');

        // Update indicator
        if (pkg.has_update()) {
            output << terminal_.style(Terminal::YELLOW) << "* " << terminal_.style(Terminal::RESET);
        } else {
            output << "  ";
        }

        // Package name (bold)
        output << terminal_.style(Terminal::BOLD) << pkg.name << terminal_.style(Terminal::RESET)
               << std::string(name_width - pkg.name.size() + 1, ' ');

        output << pkg.version;

        if (pkg.has_update()) {
            output << terminal_.style(Terminal::YELLOW) << " -> " << *pkg.updated_version
                   << terminal_.style(Terminal::RESET);
        } else if (search && !pkg.binaries.empty()) {
            output << std::string(version_width - pkg.version.size() + 1, ' ')
                   << terminal_.style(Terminal::DIM) << truncate(pkg.binaries, BINARIES_MAX_LEN)
                   << terminal_.style(Terminal::RESET);
        } else if (!search && (!pkg.updated.empty() || !pkg.info.empty())) {
            // Install time, then notes such as "Global install" or "Held package"
            output << std::string(version_width - pkg.version.size() + 1, ' ')
                   << terminal_.style(Terminal::DIM) << pkg.updated;
            if (!pkg.info.empty()) {
                output << (pkg.updated.empty() ? "" : "  ") << pkg.info;
            }
            output << terminal_.style(Terminal::RESET);
        }
        output << "\n";
    }

    terminal_.write(output.str());
}

void App::draw_failure(const CommandResult& result) {
    terminal_.write_error_line(terminal_.style(Terminal::RED) + std::string("Error: ") +
                               describe(result.error) + terminal_.style(Terminal::RESET));

    // Tool diagnostics are shown verbatim
    if (!result.message.empty()) {
        terminal_.write_error_line(result.message);
    }
    if (result.error == ErrorKind::Launch) {
        terminal_.write_error_line("Is '" + config_.tool + "' installed? Use --tool to point at it.");
    }
}

std::string App::status_message(const CommandResult& result) const {
    const std::string& arg = result.request.argument;

    switch (result.request.kind) {
        case CommandKind::List: {
            size_t count = result.packages.size();
            auto updates = static_cast<size_t>(std::count_if(
                result.packages.begin(), result.packages.end(),
                [](const PackageRecord& p) { return p.has_update(); }));
            std::string msg = std::to_string(count) + " package" + (count == 1 ? "" : "s") +
                              " installed";
            if (updates > 0) {
                msg += ", " + std::to_string(updates) + " with updates";
            }
            return msg + ".";
        }
        case CommandKind::Search: {
            size_t count = result.packages.size();
            if (count == 0) return "No results found.";
            return "Found " + std::to_string(count) + " result" + (count == 1 ? "." : "s.");
        }
        case CommandKind::Install:
            return "Successfully installed " + arg;
        case CommandKind::Update:
            if (arg == ALL_PACKAGES) return "Updated all packages";
            return "Successfully updated " + arg;
        case CommandKind::Uninstall:
            return "Successfully uninstalled " + arg;
        case CommandKind::Cleanup:
            if (arg == ALL_PACKAGES) return "Cleaned up all packages";
            return "Cleaned up " + arg;
    }
    return "Done.";
}

std::string App::truncate(const std::string& str, size_t max_len) const {
    if (str.length() <= max_len) {
        return str;
    }
    return str.substr(0, max_len - 3) + "...";
}

} // namespace scoopdeck
