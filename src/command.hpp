#pragma once

#include "package.hpp"
#include <cstdint>
#include <string>

namespace scoopdeck {

enum class CommandKind {
    List,
    Search,
    Install,
    Update,
    Uninstall,
    Cleanup,
};

enum class CommandStatus {
    Queued,
    Running,
    Succeeded,
    Failed,
    Cancelled,
};

enum class ErrorKind {
    None,
    Launch,           // executable missing or not startable
    ToolExecution,    // tool ran and exited non-zero
    Parse,            // tool succeeded but nothing could be read from its output
    Cancelled,
    Timeout,
    InvalidArgument,  // rejected before queueing
};

// Argument meaning "every installed package" (`scoop update *`)
constexpr const char* ALL_PACKAGES = "*";

struct CommandRequest {
    CommandKind kind = CommandKind::List;
    std::string argument;  // empty for List
};

// Final outcome of one request.
struct CommandResult {
    std::uint64_t id = 0;
    CommandRequest request;
    CommandStatus status = CommandStatus::Queued;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int exit_code = -1;
    PackageList packages;  // List and Search only
    std::size_t dropped_lines = 0;

    bool ok() const { return status == CommandStatus::Succeeded; }
    bool has_error() const { return error != ErrorKind::None; }
};

const char* to_string(CommandKind kind);
const char* to_string(CommandStatus status);
const char* to_string(ErrorKind error);

// Generic user-facing text for an error kind.
std::string describe(ErrorKind error);

// True for commands that change the tool's package database.
bool is_mutating(CommandKind kind);

bool requires_argument(CommandKind kind);

// Update and Cleanup may target ALL_PACKAGES.
bool accepts_all_packages(CommandKind kind);

} // namespace scoopdeck
