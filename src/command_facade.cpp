#include "command_facade.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace scoopdeck {

struct PendingCommand {
    std::uint64_t id = 0;
    CommandRequest request;
    CommandOptions options;
    CancellationSource cancel;
    std::atomic<CommandStatus> status{CommandStatus::Queued};
    std::promise<CommandResult> promise;
    std::shared_future<CommandResult> future;
    std::once_flag finished;
    std::atomic<bool> runner_done{false};  // the tool has exited, outcome is fixed

    // Terminal state is set exactly once; later calls are ignored
    void finish(CommandResult result) {
        std::call_once(finished, [this, &result]() {
            status.store(result.status);
            promise.set_value(std::move(result));
        });
    }
};

namespace {

CommandResult make_result(const PendingCommand& command, CommandStatus status,
                          ErrorKind error = ErrorKind::None, std::string message = "") {
    CommandResult result;
    result.id = command.id;
    result.request = command.request;
    result.status = status;
    result.error = error;
    result.message = std::move(message);
    return result;
}

// Last few lines of a stream, for tools that report failures on stdout
std::string tail_lines(const std::string& text, size_t max_lines) {
    std::istringstream stream(normalize_newlines(text));
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;
        lines.push_back(line);
        if (lines.size() > max_lines) lines.pop_front();
    }

    std::string out;
    for (const auto& l : lines) {
        if (!out.empty()) out += "\n";
        out += l;
    }
    return out;
}

std::string describe_request(const CommandRequest& request) {
    if (request.argument.empty()) return to_string(request.kind);
    return std::string(to_string(request.kind)) + " " + request.argument;
}

} // anonymous namespace

std::uint64_t CommandHandle::id() const {
    return state_ ? state_->id : 0;
}

CommandStatus CommandHandle::status() const {
    return state_ ? state_->status.load() : CommandStatus::Cancelled;
}

bool CommandHandle::cancel() const {
    if (!state_ || !owner_) return false;
    return owner_->cancel(state_->id);
}

CommandFacade::CommandFacade(ToolPtr tool, ProcessRunnerPtr runner, FacadeOptions options)
    : tool_(std::move(tool)),
      runner_(std::move(runner)),
      options_(options),
      catalog_(options.search_cache_size) {
    worker_ = std::thread([this]() { worker_loop(); });
}

CommandFacade::~CommandFacade() {
    shutdown();
}

CommandHandle CommandFacade::list_installed(CommandOptions options) {
    return submit(CommandRequest{CommandKind::List, ""}, std::move(options));
}

CommandHandle CommandFacade::search(const std::string& query, CommandOptions options) {
    return submit(CommandRequest{CommandKind::Search, query}, std::move(options));
}

CommandHandle CommandFacade::install(const std::string& name, CommandOptions options) {
    return submit(CommandRequest{CommandKind::Install, name}, std::move(options));
}

CommandHandle CommandFacade::update(const std::string& name, CommandOptions options) {
    return submit(CommandRequest{CommandKind::Update, name}, std::move(options));
}

CommandHandle CommandFacade::uninstall(const std::string& name, CommandOptions options) {
    return submit(CommandRequest{CommandKind::Uninstall, name}, std::move(options));
}

CommandHandle CommandFacade::cleanup(const std::string& name, CommandOptions options) {
    return submit(CommandRequest{CommandKind::Cleanup, name}, std::move(options));
}

CommandHandle CommandFacade::update_all(CommandOptions options) {
    return submit(CommandRequest{CommandKind::Update, ALL_PACKAGES}, std::move(options));
}

CommandHandle CommandFacade::cleanup_all(CommandOptions options) {
    return submit(CommandRequest{CommandKind::Cleanup, ALL_PACKAGES}, std::move(options));
}

CommandHandle CommandFacade::get_installed(CommandOptions options) {
    auto cached = catalog_.get_installed();
    if (!cached) {
        return list_installed(std::move(options));
    }

    CommandResult result;
    result.status = CommandStatus::Succeeded;
    result.exit_code = 0;
    result.packages = std::move(*cached);
    spdlog::debug("installed listing served from cache ({} packages)", result.packages.size());
    return resolved(CommandRequest{CommandKind::List, ""}, std::move(result));
}

CommandHandle CommandFacade::submit(CommandRequest request, CommandOptions options) {
    if (requires_argument(request.kind)) {
        request.argument = trim(request.argument);
        std::string problem;
        if (request.argument.empty()) {
            problem = std::string(to_string(request.kind)) + " needs a package name or query";
        } else if (request.argument[0] == '-') {
            problem = "'" + request.argument + "' looks like an option, not a package";
        } else if (request.argument == ALL_PACKAGES && !accepts_all_packages(request.kind)) {
            problem = std::string(to_string(request.kind)) + " cannot target all packages";
        }
        if (!problem.empty()) {
            CommandResult result;
            result.status = CommandStatus::Failed;
            result.error = ErrorKind::InvalidArgument;
            result.message = problem;
            spdlog::warn("rejected {}: {}", describe_request(request), result.message);
            return resolved(std::move(request), std::move(result));
        }
    } else {
        request.argument.clear();
    }

    auto command = std::make_shared<PendingCommand>();
    command->id = next_id_++;
    command->request = std::move(request);
    command->options = std::move(options);
    command->future = command->promise.get_future().share();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!stop_) {
            queue_.push_back(command);
            spdlog::info("[{}] queued: {}", command->id, describe_request(command->request));
            queue_cv_.notify_one();
            return make_handle(command);
        }
    }

    command->finish(make_result(*command, CommandStatus::Cancelled, ErrorKind::Cancelled,
                                "command facade is shutting down"));
    return make_handle(command);
}

bool CommandFacade::cancel(std::uint64_t id) {
    std::shared_ptr<PendingCommand> removed;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        auto it = std::find_if(queue_.begin(), queue_.end(),
            [id](const std::shared_ptr<PendingCommand>& c) { return c->id == id; });
        if (it != queue_.end()) {
            removed = *it;
            queue_.erase(it);
        } else if (active_ && active_->id == id) {
            if (active_->runner_done.load()) {
                return false;
            }
            spdlog::info("[{}] cancelling running command", id);
            active_->cancel.cancel();
            return true;
        } else {
            return false;
        }
    }

    spdlog::info("[{}] cancelled before start", id);
    removed->finish(make_result(*removed, CommandStatus::Cancelled, ErrorKind::Cancelled,
                                "cancelled before start"));
    return true;
}

void CommandFacade::shutdown() {
    std::deque<std::shared_ptr<PendingCommand>> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_ && !worker_.joinable()) return;
        stop_ = true;
        abandoned.swap(queue_);
        if (active_) {
            active_->cancel.cancel();
        }
    }
    queue_cv_.notify_all();

    for (auto& command : abandoned) {
        command->finish(make_result(*command, CommandStatus::Cancelled, ErrorKind::Cancelled,
                                    "command facade is shutting down"));
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

std::size_t CommandFacade::pending_commands() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void CommandFacade::worker_loop() {
    while (true) {
        std::shared_ptr<PendingCommand> command;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopped and drained
            }
            command = queue_.front();
            queue_.pop_front();
            active_ = command;
        }

        if (command->cancel.is_cancellation_requested()) {
            command->finish(make_result(*command, CommandStatus::Cancelled,
                                        ErrorKind::Cancelled, "cancelled before start"));
        } else {
            command->status.store(CommandStatus::Running);
            try {
                command->finish(execute(*command));
            } catch (const std::exception& e) {
                // A throwing progress callback must not take the queue down
                command->runner_done.store(true);
                spdlog::error("[{}] aborted: {}", command->id, e.what());
                command->finish(make_result(*command, CommandStatus::Failed,
                                            ErrorKind::ToolExecution,
                                            std::string("aborted: ") + e.what()));
            }
        }

        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_.reset();
    }
}

CommandResult CommandFacade::execute(PendingCommand& command) {
    const CommandRequest& request = command.request;
    auto started = std::chrono::steady_clock::now();

    std::vector<std::string> argv = tool_->command_line(request);
    spdlog::info("[{}] running: {}", command.id, describe_request(request));
    if (spdlog::should_log(spdlog::level::debug)) {
        std::string joined;
        for (const auto& arg : argv) {
            if (!joined.empty()) joined += ' ';
            joined += arg;
        }
        spdlog::debug("[{}] argv: {}", command.id, joined);
    }

    RunOptions run_options;
    run_options.cancel = command.cancel.token();
    run_options.kill_grace = options_.kill_grace;
    auto timeout = command.options.timeout ? command.options.timeout : options_.default_timeout;
    if (timeout) {
        run_options.deadline = started + *timeout;
    }
    const LineCallback& relay = command.options.on_line;
    std::uint64_t id = command.id;
    run_options.on_line = [&relay, id](OutputStream stream, const std::string& line) {
        spdlog::debug("[{}] {} {}", id, stream == OutputStream::Stderr ? "!" : ">", line);
        if (relay) relay(stream, line);
    };

    RunResult run = runner_->run(argv, run_options);
    command.runner_done.store(true);

    CommandResult result = make_result(command, CommandStatus::Failed);
    result.exit_code = run.exit_code;

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (run.has_error()) {
        result.status = run.error == ErrorKind::Cancelled ? CommandStatus::Cancelled
                                                          : CommandStatus::Failed;
        result.error = run.error;
        result.message = run.error_message;
        if (run.error == ErrorKind::Cancelled) {
            spdlog::info("[{}] cancelled after {} ms", command.id, elapsed_ms);
        } else {
            spdlog::error("[{}] {}: {}", command.id, to_string(run.error), run.error_message);
        }
        return result;
    }

    if (run.exit_code != 0) {
        result.error = ErrorKind::ToolExecution;
        std::string diagnostic = trim(run.stderr_text);
        if (diagnostic.empty()) diagnostic = tail_lines(run.stdout_text, 5);
        result.message = diagnostic.empty()
            ? tool_->name() + " exited with code " + std::to_string(run.exit_code)
            : diagnostic;
        spdlog::error("[{}] {} failed (code={})", command.id, describe_request(request),
                      run.exit_code);
        return result;
    }

    if (!trim(run.stderr_text).empty()) {
        spdlog::warn("[{}] {}", command.id, trim(run.stderr_text));
    }

    if (request.kind == CommandKind::List || request.kind == CommandKind::Search) {
        const OutputParser& parser = tool_->parser();
        ParseResult parsed = request.kind == CommandKind::List
            ? parser.parse_installed_list(run.stdout_text)
            : parser.parse_search_results(run.stdout_text);

        result.dropped_lines = parsed.dropped;
        if (parsed.is_format_mismatch()) {
            result.error = ErrorKind::Parse;
            result.message = "no package rows recognised in " + tool_->name() + " output (" +
                             std::to_string(parsed.dropped) + " unreadable lines, parser '" +
                             parser.name() + "')";
            spdlog::error("[{}] {}", command.id, result.message);
            return result;
        }
        if (parsed.dropped > 0) {
            spdlog::warn("[{}] skipped {} unreadable lines", command.id, parsed.dropped);
        }

        if (request.kind == CommandKind::List) {
            catalog_.set_installed(parsed.records);
        } else {
            catalog_.set_search(request.argument, parsed.records);
        }
        result.packages = std::move(parsed.records);
        spdlog::info("[{}] loaded {} packages in {} ms", command.id, result.packages.size(),
                     elapsed_ms);
    } else {
        // The tool's own listing is the source of truth after a change
        catalog_.invalidate_installed();
        spdlog::info("[{}] {} finished in {} ms", command.id, describe_request(request),
                     elapsed_ms);
    }

    result.status = CommandStatus::Succeeded;
    return result;
}

CommandHandle CommandFacade::make_handle(std::shared_ptr<PendingCommand> command) {
    CommandHandle handle;
    handle.future_ = command->future;
    handle.state_ = std::move(command);
    handle.owner_ = this;
    return handle;
}

CommandHandle CommandFacade::resolved(CommandRequest request, CommandResult result) {
    auto command = std::make_shared<PendingCommand>();
    command->id = next_id_++;
    command->request = std::move(request);
    command->future = command->promise.get_future().share();

    result.id = command->id;
    result.request = command->request;
    command->finish(std::move(result));
    return make_handle(command);
}

} // namespace scoopdeck
