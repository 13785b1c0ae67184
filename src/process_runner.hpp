#pragma once

#include "cancellation.hpp"
#include "command.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scoopdeck {

enum class OutputStream {
    Stdout,
    Stderr,
};

// Called once per complete output line, without the line terminator.
using LineCallback = std::function<void(OutputStream stream, const std::string& line)>;

struct RunOptions {
    CancellationToken cancel;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    LineCallback on_line;
    std::chrono::milliseconds kill_grace{2000};  // SIGTERM -> SIGKILL
};

struct RunResult {
    int exit_code = -1;        // 128 + signal when the child was killed
    std::string stdout_text;
    std::string stderr_text;
    ErrorKind error = ErrorKind::None;  // Launch, Cancelled or Timeout
    std::string error_message;

    bool has_error() const { return error != ErrorKind::None; }
};

// Runs one external command to completion. The child is always terminated
// and reaped before run() returns.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual RunResult run(const std::vector<std::string>& argv, const RunOptions& options) = 0;
};

using ProcessRunnerPtr = std::unique_ptr<ProcessRunner>;

// fork/exec implementation. The child gets its own process group so
// cancellation also reaches anything it spawned.
class PosixProcessRunner : public ProcessRunner {
public:
    RunResult run(const std::vector<std::string>& argv, const RunOptions& options) override;

    // Granularity of cancellation/deadline checks while waiting for output
    static constexpr int POLL_INTERVAL_MS = 50;
};

} // namespace scoopdeck
