#pragma once

#include "command.hpp"
#include "package_catalog.hpp"
#include "process_runner.hpp"
#include "tool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace scoopdeck {

class CommandFacade;
struct PendingCommand;

struct CommandOptions {
    LineCallback on_line;  // progress lines, called on the worker thread
    std::optional<std::chrono::milliseconds> timeout;
};

struct FacadeOptions {
    std::optional<std::chrono::milliseconds> default_timeout;  // none: wait forever
    std::chrono::milliseconds kill_grace{2000};
    std::size_t search_cache_size = PackageCatalog::DEFAULT_SEARCH_CAPACITY;
};

// Caller's view of one request. Copies refer to the same request.
class CommandHandle {
public:
    CommandHandle() = default;

    bool valid() const { return state_ != nullptr; }
    std::uint64_t id() const;
    CommandStatus status() const;

    std::shared_future<CommandResult> result() const { return future_; }

    // Blocks until the request reaches a terminal state
    CommandResult wait() const { return future_.get(); }

    // Removes a queued request or asks a running one to stop. False once the
    // tool has exited; its result then stands. A true return for a running
    // request is a request only: the result says whether it took effect.
    bool cancel() const;

private:
    friend class CommandFacade;

    std::shared_ptr<PendingCommand> state_;
    std::shared_future<CommandResult> future_;
    CommandFacade* owner_ = nullptr;
};

// Serializes package-manager invocations through one worker thread and keeps
// the catalog in step with their results. Handles must not outlive it.
class CommandFacade {
public:
    CommandFacade(ToolPtr tool, ProcessRunnerPtr runner, FacadeOptions options = {});
    ~CommandFacade();

    CommandFacade(const CommandFacade&) = delete;
    CommandFacade& operator=(const CommandFacade&) = delete;

    CommandHandle list_installed(CommandOptions options = {});
    CommandHandle search(const std::string& query, CommandOptions options = {});
    CommandHandle install(const std::string& name, CommandOptions options = {});
    CommandHandle update(const std::string& name, CommandOptions options = {});
    CommandHandle uninstall(const std::string& name, CommandOptions options = {});
    CommandHandle cleanup(const std::string& name, CommandOptions options = {});

    // `update *` / `cleanup *` over every installed package
    CommandHandle update_all(CommandOptions options = {});
    CommandHandle cleanup_all(CommandOptions options = {});

    // Cached listing when there is one, otherwise a fresh List
    CommandHandle get_installed(CommandOptions options = {});

    CommandHandle submit(CommandRequest request, CommandOptions options = {});

    bool cancel(std::uint64_t id);

    // Cancels everything and stops the worker; later submits resolve Cancelled
    void shutdown();

    const PackageCatalog& catalog() const { return catalog_; }
    const Tool& tool() const { return *tool_; }

    // Queued requests, not counting the running one
    std::size_t pending_commands() const;

private:
    void worker_loop();
    CommandResult execute(PendingCommand& command);
    CommandHandle make_handle(std::shared_ptr<PendingCommand> command);
    CommandHandle resolved(CommandRequest request, CommandResult result);

    ToolPtr tool_;
    ProcessRunnerPtr runner_;
    FacadeOptions options_;
    PackageCatalog catalog_;

    std::atomic<std::uint64_t> next_id_{1};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<PendingCommand>> queue_;
    std::shared_ptr<PendingCommand> active_;
    bool stop_ = false;

    std::thread worker_;
};

} // namespace scoopdeck
