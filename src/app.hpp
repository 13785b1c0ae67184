#pragma once

#include "command_facade.hpp"
#include "config.hpp"
#include "terminal.hpp"
#include <atomic>
#include <string>

namespace scoopdeck {

// Terminal driver: issues one command through the facade, shows live
// progress and prints the outcome.
class App {
public:
    enum ExitCode {
        EXIT_OK = 0,
        EXIT_FAILED = 1,
        EXIT_USAGE = 2,
        EXIT_INTERRUPTED = 130,
    };

    App(const Config& config, CommandFacade& facade, const std::atomic<bool>& interrupted);

    int run();

private:
    CommandHandle dispatch();
    CommandResult await(const CommandHandle& handle);
    void on_progress(OutputStream stream, const std::string& line);

    void draw_packages(const PackageList& packages, bool search);
    void draw_failure(const CommandResult& result);
    std::string status_message(const CommandResult& result) const;

    std::string truncate(const std::string& str, size_t max_len) const;

    const Config& config_;
    CommandFacade& facade_;
    const std::atomic<bool>& interrupted_;
    Terminal terminal_;

    static constexpr int WAIT_SLICE_MS = 100;
    static constexpr size_t BINARIES_MAX_LEN = 40;
};

} // namespace scoopdeck
