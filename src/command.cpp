#include "command.hpp"

namespace scoopdeck {

const char* to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::List:      return "list";
        case CommandKind::Search:    return "search";
        case CommandKind::Install:   return "install";
        case CommandKind::Update:    return "update";
        case CommandKind::Uninstall: return "uninstall";
        case CommandKind::Cleanup:   return "cleanup";
    }
    return "unknown";
}

const char* to_string(CommandStatus status) {
    switch (status) {
        case CommandStatus::Queued:    return "queued";
        case CommandStatus::Running:   return "running";
        case CommandStatus::Succeeded: return "succeeded";
        case CommandStatus::Failed:    return "failed";
        case CommandStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(ErrorKind error) {
    switch (error) {
        case ErrorKind::None:            return "none";
        case ErrorKind::Launch:          return "launch";
        case ErrorKind::ToolExecution:   return "tool-execution";
        case ErrorKind::Parse:           return "parse";
        case ErrorKind::Cancelled:       return "cancelled";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

std::string describe(ErrorKind error) {
    switch (error) {
        case ErrorKind::None:
            return "";
        case ErrorKind::Launch:
            return "Package manager could not be started (not installed or not on PATH?)";
        case ErrorKind::ToolExecution:
            return "Package manager reported an error";
        case ErrorKind::Parse:
            return "Package manager output could not be understood";
        case ErrorKind::Cancelled:
            return "Request cancelled";
        case ErrorKind::Timeout:
            return "Package manager did not finish in time";
        case ErrorKind::InvalidArgument:
            return "Invalid package name or query";
    }
    return "Unknown error";
}

bool is_mutating(CommandKind kind) {
    switch (kind) {
        case CommandKind::Install:
        case CommandKind::Update:
        case CommandKind::Uninstall:
        case CommandKind::Cleanup:
            return true;
        case CommandKind::List:
        case CommandKind::Search:
            return false;
    }
    return false;
}

bool requires_argument(CommandKind kind) {
    return kind != CommandKind::List;
}

bool accepts_all_packages(CommandKind kind) {
    return kind == CommandKind::Update || kind == CommandKind::Cleanup;
}

} // namespace scoopdeck
