#include "command_facade.hpp"
#include "tools/scoop.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scoopdeck {
namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

const char* const LISTING =
    "Name  Version  Source\n"
    "----  -------  ------\n"
    "7zip  23.01    main\n"
    "git   2.43.0   main\n";

const char* const LISTING_AFTER_INSTALL =
    "Name    Version  Source\n"
    "----    -------  ------\n"
    "7zip    23.01    main\n"
    "git     2.43.0   main\n"
    "neovim  0.9.5    extras\n";

const char* const SEARCH_GIT =
    "Results from local buckets...\n"
    "Name   Version  Source  Binaries\n"
    "----   -------  ------  --------\n"
    "git    2.43.0   main    git.exe\n"
    "gitui  0.24.3   main    gitui.exe\n";

RunResult output(const std::string& stdout_text, int exit_code = 0,
                 const std::string& stderr_text = "") {
    RunResult result;
    result.exit_code = exit_code;
    result.stdout_text = stdout_text;
    result.stderr_text = stderr_text;
    return result;
}

struct RunnerCall {
    std::vector<std::string> argv;
    std::optional<Clock::time_point> deadline;
    Clock::time_point started;
    Clock::time_point finished;
};

// Scripted runner shared between the test body and the facade's worker.
// Responses are keyed by tool verb (argv[1]).
class FakeRunnerState {
public:
    void respond(const std::string& verb, RunResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[verb] = std::move(result);
    }

    void throw_on(const std::string& verb) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_verb_ = verb;
    }

    // Holds calls with this verb until release() or cancellation
    void block(const std::string& verb) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_verb_ = verb;
        released_ = false;
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool wait_until_started(const std::string& verb) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 5s, [this, &verb]() { return count_locked(verb) > 0; });
    }

    std::vector<RunnerCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::size_t count(const std::string& verb) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked(verb);
    }

    RunResult run(const std::vector<std::string>& argv, const RunOptions& options) {
        std::string verb = argv.size() > 1 ? argv[1] : "";

        std::unique_lock<std::mutex> lock(mutex_);
        std::size_t index = calls_.size();
        calls_.push_back(RunnerCall{argv, options.deadline, Clock::now(), {}});
        cv_.notify_all();

        if (verb == blocked_verb_) {
            while (!released_ && !options.cancel.is_cancellation_requested()) {
                cv_.wait_for(lock, 10ms);
            }
        }
        if (options.cancel.is_cancellation_requested()) {
            calls_[index].finished = Clock::now();
            RunResult cancelled;
            cancelled.exit_code = 143;
            cancelled.error = ErrorKind::Cancelled;
            cancelled.error_message = "'" + argv[0] + "' was cancelled";
            return cancelled;
        }
        if (verb == throw_verb_) {
            calls_[index].finished = Clock::now();
            throw std::runtime_error("runner exploded");
        }

        auto it = responses_.find(verb);
        RunResult result = it != responses_.end() ? it->second : output("");
        lock.unlock();

        if (options.on_line) {
            std::istringstream lines(result.stdout_text);
            std::string line;
            while (std::getline(lines, line)) {
                options.on_line(OutputStream::Stdout, line);
            }
        }

        lock.lock();
        calls_[index].finished = Clock::now();
        return result;
    }

private:
    std::size_t count_locked(const std::string& verb) const {
        std::size_t n = 0;
        for (const auto& call : calls_) {
            if (call.argv.size() > 1 && call.argv[1] == verb) ++n;
        }
        return n;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, RunResult> responses_;
    std::vector<RunnerCall> calls_;
    std::string blocked_verb_;
    std::string throw_verb_;
    bool released_ = false;
};

class FakeProcessRunner : public ProcessRunner {
public:
    explicit FakeProcessRunner(std::shared_ptr<FakeRunnerState> state)
        : state_(std::move(state)) {}

    RunResult run(const std::vector<std::string>& argv, const RunOptions& options) override {
        return state_->run(argv, options);
    }

private:
    std::shared_ptr<FakeRunnerState> state_;
};

// Parser that holds List parsing until opened, so a command can sit in the
// facade after its process has exited.
class GatedParser : public OutputParser {
public:
    std::string name() const override { return "gated"; }

    ParseResult parse_installed_list(const std::string& raw_text) const override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait_for(lock, 5s, [this]() { return open_; });
        return inner_.parse_installed_list(raw_text);
    }

    ParseResult parse_search_results(const std::string& raw_text) const override {
        return inner_.parse_search_results(raw_text);
    }

    bool wait_until_entered() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 5s, [this]() { return entered_; });
    }

    void open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    JsonOutputParser inner_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool entered_ = false;
    mutable bool open_ = false;
};

class GatedTool : public Tool {
public:
    explicit GatedTool(const GatedParser& parser) : parser_(parser) {}

    std::string name() const override { return scoop_.name(); }
    bool is_available() const override { return true; }
    std::vector<std::string> command_line(const CommandRequest& request) const override {
        return scoop_.command_line(request);
    }
    const OutputParser& parser() const override { return parser_; }

private:
    ScoopTool scoop_;
    const GatedParser& parser_;
};

class CommandFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        make_facade(FacadeOptions{});
    }

    void TearDown() override {
        runner->release();
        facade.reset();
    }

    void make_facade(FacadeOptions options) {
        facade.reset();
        runner = std::make_shared<FakeRunnerState>();
        runner->respond("export", output(LISTING));
        runner->respond("search", output(SEARCH_GIT));
        facade = std::make_unique<CommandFacade>(std::make_unique<ScoopTool>(),
                                                 std::make_unique<FakeProcessRunner>(runner),
                                                 options);
    }

    std::shared_ptr<FakeRunnerState> runner;
    std::unique_ptr<CommandFacade> facade;
};

TEST_F(CommandFacadeTest, ListInstalledParsesAndCaches) {
    CommandResult result = facade->list_installed().wait();

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.request.kind, CommandKind::List);
    ASSERT_EQ(result.packages.size(), 2u);
    EXPECT_EQ(result.packages[0].name, "7zip");
    EXPECT_EQ(result.packages[1].name, "git");

    auto cached = facade->catalog().get_installed();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, result.packages);

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"scoop", "export"}));
}

TEST_F(CommandFacadeTest, ListInstalledReadsExportJson) {
    runner->respond("export", output(
        "WARN  Scoop was updated more than a week ago.\n"
        "{\"buckets\":[{\"Name\":\"main\"}],\"apps\":["
        "{\"Name\":\"7zip\",\"Version\":\"23.01\",\"Source\":\"main\","
        "\"Updated\":\"2024-01-15T10:22:33.1234567+01:00\",\"Info\":\"Held package\"}]}\n"));

    CommandResult result = facade->list_installed().wait();

    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(result.packages.size(), 1u);
    EXPECT_EQ(result.packages[0].name, "7zip");
    EXPECT_EQ(result.packages[0].updated, "2024-01-15 10:22:33");
    EXPECT_EQ(result.packages[0].info, "Held package");
    auto cached = facade->catalog().get_installed();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, result.packages);
}

TEST_F(CommandFacadeTest, SearchResultIsCachedByQuery) {
    CommandResult result = facade->search("git").wait();

    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(result.packages.size(), 2u);
    EXPECT_EQ(result.packages[1].binaries, "gitui.exe");
    EXPECT_TRUE(facade->catalog().get_search("git").has_value());
    EXPECT_FALSE(facade->catalog().get_installed().has_value());
}

TEST_F(CommandFacadeTest, ArgumentIsTrimmedBeforeRunning) {
    ASSERT_TRUE(facade->install("  git ").wait().ok());

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"scoop", "install", "git"}));
}

TEST_F(CommandFacadeTest, CommandsRunInSubmissionOrder) {
    runner->block("install");

    CommandHandle install = facade->install("neovim");
    ASSERT_TRUE(runner->wait_until_started("install"));
    CommandHandle search = facade->search("git");

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(runner->count("search"), 0u);
    EXPECT_EQ(search.status(), CommandStatus::Queued);
    EXPECT_EQ(install.status(), CommandStatus::Running);
    EXPECT_EQ(facade->pending_commands(), 1u);

    runner->release();
    EXPECT_TRUE(install.wait().ok());
    EXPECT_TRUE(search.wait().ok());

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].argv[1], "install");
    EXPECT_EQ(calls[1].argv[1], "search");
    EXPECT_TRUE(calls[1].started >= calls[0].finished);
}

TEST_F(CommandFacadeTest, HandlesHaveDistinctIds) {
    CommandHandle a = facade->list_installed();
    CommandHandle b = facade->search("git");

    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(a.wait().id, a.id());
    EXPECT_EQ(b.wait().id, b.id());
}

TEST_F(CommandFacadeTest, CancelQueuedCommandNeverRuns) {
    runner->block("install");

    CommandHandle install = facade->install("neovim");
    ASSERT_TRUE(runner->wait_until_started("install"));
    CommandHandle search = facade->search("git");

    EXPECT_TRUE(search.cancel());
    CommandResult cancelled = search.wait();
    EXPECT_EQ(cancelled.status, CommandStatus::Cancelled);
    EXPECT_EQ(cancelled.error, ErrorKind::Cancelled);

    runner->release();
    EXPECT_TRUE(install.wait().ok());

    EXPECT_EQ(runner->count("search"), 0u);
    EXPECT_FALSE(facade->catalog().get_search("git").has_value());
    EXPECT_FALSE(search.cancel());
}

TEST_F(CommandFacadeTest, CancelRunningMutationKeepsPreviousListing) {
    CommandResult listing = facade->list_installed().wait();
    ASSERT_TRUE(listing.ok());

    runner->block("install");
    CommandHandle install = facade->install("neovim");
    ASSERT_TRUE(runner->wait_until_started("install"));

    EXPECT_TRUE(install.cancel());
    CommandResult result = install.wait();

    EXPECT_EQ(result.status, CommandStatus::Cancelled);
    EXPECT_EQ(result.error, ErrorKind::Cancelled);
    auto cached = facade->catalog().get_installed();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, listing.packages);
}

TEST_F(CommandFacadeTest, QueueContinuesAfterCancel) {
    runner->block("install");
    CommandHandle install = facade->install("neovim");
    ASSERT_TRUE(runner->wait_until_started("install"));
    CommandHandle listing = facade->list_installed();

    install.cancel();
    EXPECT_EQ(install.wait().status, CommandStatus::Cancelled);
    EXPECT_TRUE(listing.wait().ok());
}

TEST_F(CommandFacadeTest, GetInstalledServesCacheUntilMutation) {
    CommandResult first = facade->get_installed().wait();
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(runner->count("export"), 1u);

    CommandResult cached = facade->get_installed().wait();
    ASSERT_TRUE(cached.ok());
    EXPECT_EQ(cached.packages, first.packages);
    EXPECT_EQ(runner->count("export"), 1u);

    runner->respond("export", output(LISTING_AFTER_INSTALL));
    ASSERT_TRUE(facade->install("neovim").wait().ok());
    EXPECT_FALSE(facade->catalog().get_installed().has_value());

    CommandResult refreshed = facade->get_installed().wait();
    ASSERT_TRUE(refreshed.ok());
    EXPECT_EQ(runner->count("export"), 2u);
    ASSERT_EQ(refreshed.packages.size(), 3u);
    EXPECT_EQ(refreshed.packages[2].name, "neovim");
}

TEST_F(CommandFacadeTest, FailedMutationKeepsListing) {
    ASSERT_TRUE(facade->list_installed().wait().ok());
    runner->respond("uninstall", output("", 1, "'nope' isn't installed.\n"));

    CommandResult result = facade->uninstall("nope").wait();

    EXPECT_EQ(result.error, ErrorKind::ToolExecution);
    EXPECT_TRUE(facade->catalog().get_installed().has_value());
}

TEST_F(CommandFacadeTest, NonZeroExitReportsStderr) {
    runner->respond("install", output("", 1, "Couldn't find manifest for 'nope'.\n"));

    CommandResult result = facade->install("nope").wait();

    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.error, ErrorKind::ToolExecution);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.message, "Couldn't find manifest for 'nope'.");

    EXPECT_TRUE(facade->list_installed().wait().ok());
}

TEST_F(CommandFacadeTest, NonZeroExitFallsBackToStdoutTail) {
    runner->respond("update", output("Updating 'git'\nERROR Download failed\n", 2));

    CommandResult result = facade->update("git").wait();

    EXPECT_EQ(result.error, ErrorKind::ToolExecution);
    EXPECT_NE(result.message.find("ERROR Download failed"), std::string::npos);
}

TEST_F(CommandFacadeTest, StderrOnSuccessIsNotAFailure) {
    runner->respond("cleanup", output("Removing git 2.42.0\n", 0, "WARN cache is large\n"));

    CommandResult result = facade->cleanup("git").wait();

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());
}

TEST_F(CommandFacadeTest, UnreadableOutputIsParseError) {
    ASSERT_TRUE(facade->list_installed().wait().ok());
    auto before = facade->catalog().get_installed();

    runner->respond("export", output("Access is denied\nsomething else broke\n"));
    CommandResult result = facade->list_installed().wait();

    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.error, ErrorKind::Parse);
    EXPECT_EQ(result.dropped_lines, 2u);
    auto after = facade->catalog().get_installed();
    ASSERT_TRUE(before.has_value() && after.has_value());
    EXPECT_EQ(*after, *before);
}

TEST_F(CommandFacadeTest, EmptyOutputIsEmptyListing) {
    runner->respond("export", output(""));

    CommandResult result = facade->list_installed().wait();

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.packages.empty());
    auto cached = facade->catalog().get_installed();
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->empty());
}

TEST_F(CommandFacadeTest, InvalidArgumentsAreRejectedWithoutRunning) {
    CommandResult empty = facade->install("").wait();
    CommandResult blank = facade->search("   ").wait();
    CommandResult option = facade->uninstall("--global").wait();

    EXPECT_EQ(empty.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(blank.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(option.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(option.status, CommandStatus::Failed);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(CommandFacadeTest, UpdateAllRunsWildcardAndInvalidatesListing) {
    ASSERT_TRUE(facade->list_installed().wait().ok());

    CommandResult result = facade->update_all().wait();

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.request.kind, CommandKind::Update);
    EXPECT_EQ(result.request.argument, "*");
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].argv, (std::vector<std::string>{"scoop", "update", "*"}));
    EXPECT_FALSE(facade->catalog().get_installed().has_value());
}

TEST_F(CommandFacadeTest, CleanupAllRunsWildcardAndInvalidatesListing) {
    ASSERT_TRUE(facade->list_installed().wait().ok());

    CommandResult result = facade->cleanup_all().wait();

    ASSERT_TRUE(result.ok()) << result.message;
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].argv, (std::vector<std::string>{"scoop", "cleanup", "*"}));
    EXPECT_FALSE(facade->catalog().get_installed().has_value());
}

TEST_F(CommandFacadeTest, WildcardOnlyForUpdateAndCleanup) {
    CommandResult install = facade->install("*").wait();
    CommandResult uninstall = facade->uninstall("*").wait();
    CommandResult search = facade->search("*").wait();

    EXPECT_EQ(install.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(uninstall.error, ErrorKind::InvalidArgument);
    EXPECT_EQ(search.error, ErrorKind::InvalidArgument);
    EXPECT_TRUE(runner->calls().empty());

    EXPECT_TRUE(facade->update("*").wait().ok());
    EXPECT_EQ(runner->count("update"), 1u);
}

TEST_F(CommandFacadeTest, CancelAfterToolExitedIsRefused) {
    GatedParser parser;
    runner = std::make_shared<FakeRunnerState>();
    runner->respond("export", output(LISTING));
    facade = std::make_unique<CommandFacade>(std::make_unique<GatedTool>(parser),
                                             std::make_unique<FakeProcessRunner>(runner),
                                             FacadeOptions{});

    CommandHandle listing = facade->list_installed();
    ASSERT_TRUE(parser.wait_until_entered());

    EXPECT_FALSE(listing.cancel());
    parser.open();

    CommandResult result = listing.wait();
    EXPECT_EQ(result.status, CommandStatus::Succeeded);
    EXPECT_EQ(result.packages.size(), 2u);
    facade.reset();
}

TEST_F(CommandFacadeTest, LaunchFailureIsReported) {
    RunResult missing;
    missing.error = ErrorKind::Launch;
    missing.error_message = "'scoop' not found";
    runner->respond("export", missing);

    CommandResult result = facade->list_installed().wait();

    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.error, ErrorKind::Launch);
    EXPECT_EQ(result.message, "'scoop' not found");
    EXPECT_FALSE(facade->catalog().get_installed().has_value());
}

TEST_F(CommandFacadeTest, RunnerExceptionFailsOnlyThatCommand) {
    runner->throw_on("install");

    CommandHandle install = facade->install("git");
    CommandHandle listing = facade->list_installed();

    CommandResult failed = install.wait();
    EXPECT_EQ(failed.status, CommandStatus::Failed);
    EXPECT_NE(failed.message.find("runner exploded"), std::string::npos);
    EXPECT_TRUE(listing.wait().ok());
}

TEST_F(CommandFacadeTest, ProgressLinesAreRelayed) {
    runner->respond("install", output("Installing 'git'\nLinking ~\\scoop\\apps\\git\\current\n"));

    std::vector<std::string> lines;
    CommandOptions options;
    options.on_line = [&lines](OutputStream stream, const std::string& line) {
        if (stream == OutputStream::Stdout) lines.push_back(line);
    };
    ASSERT_TRUE(facade->install("git", options).wait().ok());

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Installing 'git'");
}

TEST_F(CommandFacadeTest, PerCommandTimeoutBecomesDeadline) {
    CommandOptions options;
    options.timeout = 1500ms;

    auto before = Clock::now();
    ASSERT_TRUE(facade->search("git", options).wait().ok());
    ASSERT_TRUE(facade->list_installed().wait().ok());

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 2u);
    ASSERT_TRUE(calls[0].deadline.has_value());
    EXPECT_TRUE(*calls[0].deadline >= before + 1500ms);
    EXPECT_FALSE(calls[1].deadline.has_value());
}

TEST_F(CommandFacadeTest, DefaultTimeoutApplies) {
    FacadeOptions options;
    options.default_timeout = 30s;
    make_facade(options);

    ASSERT_TRUE(facade->list_installed().wait().ok());

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].deadline.has_value());
}

TEST_F(CommandFacadeTest, ShutdownCancelsOutstandingCommands) {
    runner->block("install");
    CommandHandle install = facade->install("neovim");
    ASSERT_TRUE(runner->wait_until_started("install"));
    CommandHandle listing = facade->list_installed();

    facade->shutdown();

    EXPECT_EQ(install.wait().status, CommandStatus::Cancelled);
    EXPECT_EQ(listing.wait().status, CommandStatus::Cancelled);
    EXPECT_EQ(runner->count("export"), 0u);

    CommandResult late = facade->search("git").wait();
    EXPECT_EQ(late.status, CommandStatus::Cancelled);
}

} // namespace
} // namespace scoopdeck
