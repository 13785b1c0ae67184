#include "process_runner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace scoopdeck {

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

bool make_pipe(Pipe& p) {
    int fds[2];
    if (::pipe(fds) != 0) {
        return false;
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
    return ::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 &&
           ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Owns a spawned child until it has been reaped.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (!reaped_) {
            terminate(std::chrono::milliseconds(0));
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }
    int exit_code() const { return exit_code_; }

    // Non-blocking reap; true once the child has exited.
    bool try_reap() {
        if (reaped_) return true;
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            mark_reaped(status);
        } else if (r < 0 && errno == ECHILD) {
            reaped_ = true;
        }
        return reaped_;
    }

    void wait() {
        while (!reaped_) {
            int status = 0;
            pid_t r = ::waitpid(pid_, &status, 0);
            if (r == pid_) {
                mark_reaped(status);
            } else if (r < 0 && errno != EINTR) {
                reaped_ = true;
            }
        }
    }

    // SIGTERM the whole group, SIGKILL after the grace period, then reap.
    void terminate(std::chrono::milliseconds grace) {
        if (reaped_) return;

        signal_group(SIGTERM);
        auto give_up = std::chrono::steady_clock::now() + grace;
        while (!try_reap() && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!reaped_) {
            spdlog::debug("pid {} ignored SIGTERM, sending SIGKILL", pid_);
            signal_group(SIGKILL);
            wait();
        }
    }

    // Terminates whatever is left of the process group after the child
    // itself has been reaped (background jobs, daemonized helpers).
    void clear_group(std::chrono::milliseconds grace) {
        if (::kill(-pid_, SIGTERM) != 0) {
            return;  // group is empty
        }
        spdlog::debug("pid {} left processes behind, terminating its group", pid_);

        auto give_up = std::chrono::steady_clock::now() + grace;
        while (::kill(-pid_, 0) == 0 && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (::kill(-pid_, 0) == 0) {
            ::kill(-pid_, SIGKILL);
        }
    }

private:
    void signal_group(int sig) {
        if (::kill(-pid_, sig) != 0 && errno == ESRCH) {
            // Group not formed yet (setpgid race); signal the child directly
            ::kill(pid_, sig);
        }
    }

    void mark_reaped(int status) {
        reaped_ = true;
        exit_code_ = decode_wait_status(status);
    }

    pid_t pid_;
    bool reaped_ = false;
    int exit_code_ = -1;
};

// Splits a byte stream into lines; CR, LF and CRLF all end a line.
class LineAssembler {
public:
    LineAssembler(OutputStream stream, const LineCallback& callback)
        : stream_(stream), callback_(callback) {}

    void feed(const char* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                bool crlf_tail = (c == '\n' && last_was_cr_);
                last_was_cr_ = (c == '\r');
                if (!crlf_tail) emit();
            } else {
                last_was_cr_ = false;
                pending_ += c;
            }
        }
    }

    void finish() {
        if (!pending_.empty()) emit();
    }

private:
    void emit() {
        if (callback_) callback_(stream_, pending_);
        pending_.clear();
    }

    OutputStream stream_;
    const LineCallback& callback_;
    std::string pending_;
    bool last_was_cr_ = false;
};

ErrorKind stop_requested(const RunOptions& options) {
    if (options.cancel.is_cancellation_requested()) {
        return ErrorKind::Cancelled;
    }
    if (options.deadline && std::chrono::steady_clock::now() >= *options.deadline) {
        return ErrorKind::Timeout;
    }
    return ErrorKind::None;
}

std::string launch_failure_message(const std::string& program, int err) {
    switch (err) {
        case ENOENT:
            return "'" + program + "' not found";
        case EACCES:
        case EPERM:
            return "'" + program + "': permission denied";
        default:
            return "'" + program + "' could not be started: " + std::strerror(err);
    }
}

} // anonymous namespace

RunResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                  const RunOptions& options) {
    RunResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = ErrorKind::Launch;
        result.error_message = "empty command line";
        return result;
    }

    if (options.cancel.is_cancellation_requested()) {
        result.error = ErrorKind::Cancelled;
        result.error_message = "cancelled before start";
        return result;
    }

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        result.error = ErrorKind::Launch;
        result.error_message = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = ErrorKind::Launch;
        result.error_message = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);

        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::close(dev_null);
        }
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);

        ::execvp(c_args[0], c_args.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ChildProcess child(pid);
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    // Closed without data on successful exec, carries errno otherwise
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        child.wait();
        result.error = ErrorKind::Launch;
        result.error_message = launch_failure_message(argv[0], exec_errno);
        return result;
    }

    spdlog::debug("spawned pid {}: {}", pid, argv[0]);

    LineAssembler out_lines(OutputStream::Stdout, options.on_line);
    LineAssembler err_lines(OutputStream::Stderr, options.on_line);

    struct Channel {
        FileDescriptor* fd;
        std::string* text;
        LineAssembler* lines;
    };
    std::array<Channel, 2> channels = {{
        {&out_pipe.read_end, &result.stdout_text, &out_lines},
        {&err_pipe.read_end, &result.stderr_text, &err_lines},
    }};

    std::array<char, 4096> buffer;
    ErrorKind stop_reason = ErrorKind::None;

    while (out_pipe.read_end.valid() || err_pipe.read_end.valid()) {
        stop_reason = stop_requested(options);
        if (stop_reason != ErrorKind::None) {
            break;
        }

        int wait_ms = POLL_INTERVAL_MS;
        if (options.deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *options.deadline - std::chrono::steady_clock::now()).count();
            if (remaining < wait_ms) wait_ms = static_cast<int>(std::max<long long>(remaining, 1));
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        std::array<Channel*, 2> polled{};
        for (auto& channel : channels) {
            if (channel.fd->valid()) {
                fds[count] = pollfd{channel.fd->get(), POLLIN, 0};
                polled[count] = &channel;
                ++count;
            }
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed for pid {}: {}", pid, std::strerror(errno));
            stop_reason = ErrorKind::Cancelled;
            break;
        }

        if (ready == 0) {
            // Child gone but a grandchild may still hold the pipes open
            if (child.try_reap()) break;
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            Channel& channel = *polled[i];
            ssize_t got = ::read(channel.fd->get(), buffer.data(), buffer.size());
            if (got > 0) {
                channel.text->append(buffer.data(), static_cast<size_t>(got));
                channel.lines->feed(buffer.data(), static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                channel.lines->finish();
                channel.fd->reset();
            }
        }
    }

    // Both pipes closed, but the child may still be running
    while (stop_reason == ErrorKind::None && !child.try_reap()) {
        stop_reason = stop_requested(options);
        if (stop_reason == ErrorKind::None) {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }
    }

    out_lines.finish();
    err_lines.finish();

    if (stop_reason != ErrorKind::None) {
        spdlog::debug("stopping pid {} ({})", pid, to_string(stop_reason));
        child.terminate(options.kill_grace);
        child.clear_group(options.kill_grace);
        result.exit_code = child.exit_code();
        result.error = stop_reason;
        result.error_message = stop_reason == ErrorKind::Timeout
            ? "'" + argv[0] + "' exceeded its deadline"
            : "'" + argv[0] + "' was cancelled";
        return result;
    }

    child.clear_group(options.kill_grace);
    result.exit_code = child.exit_code();
    spdlog::debug("pid {} exited with {}", pid, result.exit_code);
    return result;
}

} // namespace scoopdeck
