#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/guard_errors.hpp"
#include "policy/command_policy.hpp"
#include "policy/path_guard.hpp"
#include "protocol/execution_contract.hpp"
#include "secrets/secret_registry.hpp"
#include "session/security_audit_log.hpp"
#include "tools/command_guard.hpp"
#include "tools/process_launcher.hpp"

namespace {

using trustgate::core::errors::get_value;
using trustgate::policy::AllowedShape;
using trustgate::policy::CommandPolicy;
using trustgate::policy::PathPolicy;
using trustgate::policy::any_argument;
using trustgate::policy::default_command_policy;
using trustgate::protocol::ExecutionRequest;
using trustgate::protocol::ExecutionResult;
using trustgate::protocol::FailureKind;
using trustgate::secrets::SecretRegistry;
using trustgate::secrets::default_secret_patterns;
using trustgate::session::SecurityAuditLog;
using trustgate::tools::CommandGuard;
using trustgate::tools::ExecutionLimits;
using trustgate::tools::LaunchSpec;
using trustgate::tools::ProcessLauncher;
using trustgate::tools::ProcessOutcome;
using nlohmann::json;

constexpr const char* kSecret = "topsecretvalue123";

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_command_guard_" + trustgate::core::config::generate_session_id());
        std::filesystem::create_directories(root_ / "project" / "scripts");
        std::filesystem::create_directories(root_ / "outside");
        root_ = std::filesystem::canonical(root_);
        std::ofstream(project() / "scripts" / "train.py") << "print('training')\n";
        std::ofstream(project() / "scripts" / "notes.txt") << "not a script\n";
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path project() const { return root_ / "project"; }
    std::filesystem::path outside() const { return root_ / "outside"; }

private:
    std::filesystem::path root_;
};

// Records every launch instead of touching the operating system.
class FakeLauncher : public ProcessLauncher {
public:
    FakeLauncher() {
        outcome.state = ProcessOutcome::State::Exited;
        outcome.exit_code = 0;
        outcome.stdout_text = "ok\n";
    }

    ProcessOutcome launch(const LaunchSpec& spec) override {
        ++spawns;
        std::lock_guard<std::mutex> lock(mutex);
        last_spec = spec;
        return outcome;
    }

    std::atomic<int> spawns{0};
    ProcessOutcome outcome;
    LaunchSpec last_spec;
    std::mutex mutex;
};

std::shared_ptr<const CommandPolicy> shell_policy() {
    AllowedShape shell;
    shell.argument_checks = {any_argument()};
    return CommandPolicy::Builder().allow("sh", shell).build();
}

bool has_entry(const std::vector<std::string>& environment, const std::string& entry) {
    return std::find(environment.begin(), environment.end(), entry) != environment.end();
}

bool has_name(const std::vector<std::string>& environment, const std::string& name) {
    return std::any_of(environment.begin(), environment.end(), [&name](const std::string& e) {
        return e.rfind(name + "=", 0) == 0;
    });
}

class CommandGuardTest : public ::testing::Test {
protected:
    CommandGuardTest()
        : launcher_(std::make_shared<FakeLauncher>()),
          guard_(default_command_policy(), get_value(PathPolicy::create(workspace_.project())),
                 std::make_shared<const SecretRegistry>(std::vector<std::string>{kSecret},
                                                        default_secret_patterns()),
                 launcher_, limits()) {}

    static ExecutionLimits limits() {
        ExecutionLimits limits;
        limits.default_timeout = std::chrono::seconds(30);
        limits.max_timeout = std::chrono::minutes(10);
        return limits;
    }

    TempWorkspace workspace_;
    std::shared_ptr<FakeLauncher> launcher_;
    CommandGuard guard_;
};

}  // namespace

TEST_F(CommandGuardTest, AllowedCommandIsLaunchedInValidatedDirectory) {
    const ExecutionResult result = guard_.execute(ExecutionRequest({"git", "status"}));

    EXPECT_TRUE(result.succeeded());
    ASSERT_TRUE(result.exit_code().has_value());
    EXPECT_EQ(*result.exit_code(), 0);
    EXPECT_FALSE(result.failure_kind().has_value());
    EXPECT_EQ(result.stdout_text(), "ok\n");
    EXPECT_EQ(launcher_->spawns.load(), 1);
    EXPECT_EQ(launcher_->last_spec.argv, (std::vector<std::string>{"git", "status"}));
    EXPECT_EQ(launcher_->last_spec.working_directory, workspace_.project());
}

TEST_F(CommandGuardTest, RejectsUnknownProgramWithoutSpawning) {
    const ExecutionResult result = guard_.execute(ExecutionRequest({"rm", "-rf", "/"}));

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure_kind(), FailureKind::NotAllowed);
    EXPECT_FALSE(result.exit_code().has_value());
    EXPECT_EQ(result.message(), "Command not allowed: 'rm'");
    EXPECT_EQ(launcher_->spawns.load(), 0);
}

TEST_F(CommandGuardTest, RejectsDisallowedArgumentWithoutSpawning) {
    const ExecutionResult result = guard_.execute(ExecutionRequest({"git", "push"}));

    EXPECT_EQ(result.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(result.message(), "Argument not allowed for 'git': 'push'");
    EXPECT_EQ(launcher_->spawns.load(), 0);
}

TEST_F(CommandGuardTest, RejectsWorkingDirectoryOutsideRoot) {
    const ExecutionResult result = guard_.execute(ExecutionRequest({"git", "status"}, ".."));

    EXPECT_EQ(result.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(result.message(),
              "Working directory rejected for 'git': Path escapes project root: ..");
    EXPECT_EQ(launcher_->spawns.load(), 0);
}

TEST_F(CommandGuardTest, RejectsWorkingDirectoryThroughSymlinkAfterDotDot) {
    std::filesystem::create_directory_symlink(workspace_.outside(),
                                              workspace_.project() / "link_out");
    std::ofstream(workspace_.outside() / "train.py") << "print('outside')\n";

    const ExecutionResult result =
        guard_.execute(ExecutionRequest({"git", "status"}, "nope/../link_out"));

    EXPECT_EQ(result.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(result.message(),
              "Working directory rejected for 'git': "
              "Path escapes project root: nope/../link_out");
    EXPECT_EQ(launcher_->spawns.load(), 0);

    const ExecutionResult argument = guard_.execute(
        ExecutionRequest({"modal", "run", "nope/../link_out/train.py"}));
    EXPECT_EQ(argument.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(launcher_->spawns.load(), 0);
}

TEST_F(CommandGuardTest, RejectsPathArgumentOutsideRoot) {
    const ExecutionResult result =
        guard_.execute(ExecutionRequest({"modal", "run", "../../etc/passwd"}));

    EXPECT_EQ(result.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(launcher_->spawns.load(), 0);

    const ExecutionResult inside =
        guard_.execute(ExecutionRequest({"modal", "run", "scripts/train.py"}));
    EXPECT_TRUE(inside.succeeded());
    EXPECT_EQ(launcher_->spawns.load(), 1);
}

TEST_F(CommandGuardTest, RelativeArgumentsResolveAgainstWorkingDirectory) {
    const ExecutionResult result =
        guard_.execute(ExecutionRequest({"modal", "run", "train.py"}, "scripts"));

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(launcher_->last_spec.working_directory, workspace_.project() / "scripts");
}

TEST_F(CommandGuardTest, NonZeroExitIsReported) {
    launcher_->outcome.exit_code = 2;
    launcher_->outcome.stderr_text = "fatal: not a git repository\n";

    const ExecutionResult result = guard_.execute(ExecutionRequest({"git", "status"}));

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure_kind(), FailureKind::NonZeroExit);
    EXPECT_EQ(result.exit_code(), 2);
    EXPECT_EQ(result.message(), "Command failed with exit code 2");
    EXPECT_EQ(result.stderr_text(), "fatal: not a git repository\n");
}

TEST_F(CommandGuardTest, TimedOutAndSpawnFailedOutcomes) {
    launcher_->outcome.state = ProcessOutcome::State::TimedOut;
    const ExecutionResult timed_out = guard_.execute(
        ExecutionRequest({"git", "status"}, ".", std::chrono::milliseconds(1000)));
    EXPECT_EQ(timed_out.failure_kind(), FailureKind::TimedOut);
    EXPECT_FALSE(timed_out.exit_code().has_value());
    EXPECT_EQ(timed_out.message(), "Command timed out after 1000ms: git");

    launcher_->outcome.state = ProcessOutcome::State::SpawnFailed;
    launcher_->outcome.spawn_error = "Executable not found: git";
    const ExecutionResult spawn_failed = guard_.execute(ExecutionRequest({"git", "status"}));
    EXPECT_EQ(spawn_failed.failure_kind(), FailureKind::SpawnFailed);
    EXPECT_EQ(spawn_failed.message(), "Executable not found: git");
}

TEST_F(CommandGuardTest, TimeoutDefaultsAndClamps) {
    guard_.execute(ExecutionRequest({"git", "status"}));
    EXPECT_EQ(launcher_->last_spec.timeout, std::chrono::seconds(30));

    guard_.execute(ExecutionRequest({"git", "status"}, ".", std::chrono::hours(10)));
    EXPECT_EQ(launcher_->last_spec.timeout, std::chrono::minutes(10));

    guard_.execute(ExecutionRequest({"git", "status"}, ".", std::chrono::milliseconds(1500)));
    EXPECT_EQ(launcher_->last_spec.timeout, std::chrono::milliseconds(1500));
}

TEST_F(CommandGuardTest, OutputAndMessagesAreRedacted) {
    launcher_->outcome.stdout_text = std::string("token=") + kSecret + "\n";
    launcher_->outcome.stderr_text = "key vfrog_abcdefghij0123456789xyz\n";

    const ExecutionResult result = guard_.execute(ExecutionRequest({"git", "status"}));
    EXPECT_EQ(result.stdout_text(), "token=[REDACTED]\n");
    EXPECT_EQ(result.stderr_text(), "key [REDACTED:VFROG_API_KEY]\n");

    const ExecutionResult rejected = guard_.execute(ExecutionRequest({"git", kSecret}));
    EXPECT_EQ(rejected.failure_kind(), FailureKind::NotAllowed);
    EXPECT_EQ(rejected.message().find(kSecret), std::string::npos);
    EXPECT_EQ(rejected.message(), "Argument not allowed for 'git': '[REDACTED]'");
}

TEST_F(CommandGuardTest, RefreshedSecretsApplyToLaterCalls) {
    launcher_->outcome.stdout_text = "rotated-credential-value\n";
    EXPECT_EQ(guard_.execute(ExecutionRequest({"git", "status"})).stdout_text(),
              "rotated-credential-value\n");

    guard_.refresh_secrets(std::make_shared<const SecretRegistry>(
        std::vector<std::string>{"rotated-credential-value"}, default_secret_patterns()));
    EXPECT_EQ(guard_.execute(ExecutionRequest({"git", "status"})).stdout_text(),
              "[REDACTED]\n");
}

TEST_F(CommandGuardTest, ChildEnvironmentIsMinimal) {
    ::setenv("TRUSTGATE_TEST_LEAK", "should-not-leak", 1);
    ::setenv("MODAL_TOKEN_ID", "ak-modal-test", 1);

    const auto* git = guard_.command_policy().find("git");
    const auto* modal = guard_.command_policy().find("modal");
    ASSERT_NE(git, nullptr);
    ASSERT_NE(modal, nullptr);

    ExecutionRequest request({"git", "status"});
    request.with_env("GIT_PAGER", "cat").with_env("PATH", "/tmp/evil");

    const auto git_env = guard_.child_environment(*git, request);
    EXPECT_TRUE(has_name(git_env, "PATH"));
    EXPECT_FALSE(has_entry(git_env, "PATH=/tmp/evil"));
    EXPECT_TRUE(has_entry(git_env, "GIT_PAGER=cat"));
    EXPECT_FALSE(has_name(git_env, "TRUSTGATE_TEST_LEAK"));
    EXPECT_FALSE(has_name(git_env, "MODAL_TOKEN_ID"));

    const auto modal_env = guard_.child_environment(*modal, ExecutionRequest({"modal"}));
    EXPECT_TRUE(has_entry(modal_env, "MODAL_TOKEN_ID=ak-modal-test"));

    ::unsetenv("TRUSTGATE_TEST_LEAK");
    ::unsetenv("MODAL_TOKEN_ID");
}

TEST_F(CommandGuardTest, RunPythonValidatesScript) {
    const ExecutionResult outside = guard_.run_python("../escape.py");
    EXPECT_EQ(outside.failure_kind(), FailureKind::NotAllowed);

    const ExecutionResult wrong_type = guard_.run_python("scripts/notes.txt");
    EXPECT_EQ(wrong_type.failure_kind(), FailureKind::NotAllowed);

    const ExecutionResult missing = guard_.run_python("scripts/missing.py");
    EXPECT_EQ(missing.failure_kind(), FailureKind::SpawnFailed);
    EXPECT_EQ(missing.message(), "Script not found: scripts/missing.py");
    EXPECT_EQ(launcher_->spawns.load(), 0);

    const ExecutionResult ran = guard_.run_python("scripts/train.py", {"--epochs", "3"});
    EXPECT_TRUE(ran.succeeded());
    EXPECT_EQ(launcher_->last_spec.argv,
              (std::vector<std::string>{"python",
                                        (workspace_.project() / "scripts" / "train.py").string(),
                                        "--epochs", "3"}));
}

TEST_F(CommandGuardTest, IsAllowedDoesNotSpawn) {
    EXPECT_TRUE(guard_.is_allowed({"git", "status"}));
    EXPECT_FALSE(guard_.is_allowed({"git", "push"}));
    EXPECT_FALSE(guard_.is_allowed({"curl", "http://example.com"}));
    EXPECT_FALSE(guard_.is_allowed({}));
    EXPECT_EQ(launcher_->spawns.load(), 0);
}

TEST_F(CommandGuardTest, ConcurrentCallsAreIndependent) {
    std::vector<std::thread> workers;
    std::atomic<int> allowed{0};
    std::atomic<int> rejected{0};
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([this, i, &allowed, &rejected] {
            const auto result = guard_.execute(
                ExecutionRequest({"git", i % 2 == 0 ? "status" : "push"}));
            if (result.succeeded()) {
                ++allowed;
            } else if (result.failure_kind() == FailureKind::NotAllowed) {
                ++rejected;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(allowed.load(), 4);
    EXPECT_EQ(rejected.load(), 4);
    EXPECT_EQ(launcher_->spawns.load(), 4);
}

TEST(CommandGuardAuditTest, RejectionsAreRecorded) {
    TempWorkspace workspace;
    const auto log_file = workspace.project() / ".trustgate" / "audit.jsonl";
    auto audit_log = std::make_shared<SecurityAuditLog>(log_file, "session-test");
    const CommandGuard guard(default_command_policy(),
                             get_value(PathPolicy::create(workspace.project())),
                             std::make_shared<const SecretRegistry>(
                                 std::vector<std::string>{kSecret}, default_secret_patterns()),
                             std::make_shared<FakeLauncher>(), ExecutionLimits{}, audit_log);

    guard.execute(ExecutionRequest({"curl", kSecret}));
    guard.execute(ExecutionRequest({"git", "status"}, "/"));

    std::ifstream in(log_file);
    std::string first;
    std::string second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));

    const json command_event = json::parse(first);
    EXPECT_EQ(command_event["event"], "command_rejected");
    EXPECT_EQ(command_event["session_id"], "session-test");
    EXPECT_EQ(command_event["payload"]["message"], "Command not allowed: 'curl'");

    const json path_event = json::parse(second);
    EXPECT_EQ(path_event["event"], "path_rejected");
    EXPECT_EQ(first.find(kSecret), std::string::npos);
}

TEST(CommandGuardProcessTest, RunsRealProcessAndRedactsOutput) {
    TempWorkspace workspace;
    const CommandGuard guard(shell_policy(), get_value(PathPolicy::create(workspace.project())),
                             std::make_shared<const SecretRegistry>(
                                 std::vector<std::string>{kSecret}, default_secret_patterns()));

    const ExecutionResult result = guard.execute(ExecutionRequest(
        {"sh", "-c", std::string("echo ") + kSecret + "; pwd; exit 4"}));

    EXPECT_EQ(result.failure_kind(), FailureKind::NonZeroExit);
    EXPECT_EQ(result.exit_code(), 4);
    EXPECT_EQ(result.stdout_text(), "[REDACTED]\n" + workspace.project().string() + "\n");
}

TEST(CommandGuardProcessTest, RealTimeoutReturnsPromptly) {
    TempWorkspace workspace;
    const CommandGuard guard(shell_policy(), get_value(PathPolicy::create(workspace.project())),
                             nullptr);

    const auto started = std::chrono::steady_clock::now();
    const ExecutionResult result = guard.execute(
        ExecutionRequest({"sh", "-c", "sleep 5"}, ".", std::chrono::milliseconds(200)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.failure_kind(), FailureKind::TimedOut);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(CommandGuardProcessTest, MissingProgramIsSpawnFailure) {
    TempWorkspace workspace;
    AllowedShape shape;
    const auto policy =
        CommandPolicy::Builder().allow("trustgate-missing-program", shape).build();
    const CommandGuard guard(policy, get_value(PathPolicy::create(workspace.project())),
                             nullptr);

    const ExecutionResult result =
        guard.execute(ExecutionRequest({"trustgate-missing-program"}));
    EXPECT_EQ(result.failure_kind(), FailureKind::SpawnFailed);
    EXPECT_FALSE(guard.is_program_available("trustgate-missing-program"));
    EXPECT_TRUE(guard.is_program_available("sh"));
}

TEST(ExecutionRequestTest, EmptyArgvIsProgrammerError) {
    EXPECT_THROW(ExecutionRequest(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(ExecutionRequest({"", "status"}), std::invalid_argument);
}

TEST(CommandGuardProcessTest, GitStatusOnlyPolicyEndToEnd) {
    if (!trustgate::tools::PosixProcessLauncher::resolve_executable("git", "/usr/local/bin:/usr/bin:/bin")) {
        GTEST_SKIP() << "git is not installed";
    }
    TempWorkspace workspace;

    LaunchSpec init;
    init.argv = {"git", "init", "-q"};
    init.working_directory = workspace.project();
    init.environment = {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=" + workspace.project().string()};
    init.timeout = std::chrono::seconds(30);
    trustgate::tools::PosixProcessLauncher launcher;
    ASSERT_EQ(launcher.launch(init).exit_code, 0);

    AllowedShape git;
    git.tokens = {"status"};
    const auto counting = std::make_shared<FakeLauncher>();
    const auto policy = CommandPolicy::Builder().allow("git", git).build();
    const auto root = get_value(PathPolicy::create(workspace.project()));

    const CommandGuard guard(policy, root, nullptr);
    const ExecutionResult status = guard.execute(ExecutionRequest({"git", "status"}));
    EXPECT_TRUE(status.succeeded()) << status.stderr_text();
    EXPECT_EQ(status.exit_code(), 0);

    const CommandGuard counted(policy, root, nullptr, counting);
    EXPECT_EQ(counted.execute(ExecutionRequest({"git", "push"})).failure_kind(),
              FailureKind::NotAllowed);
    EXPECT_EQ(counted.execute(ExecutionRequest({"git", "status"}, "/outside/root"))
                  .failure_kind(),
              FailureKind::NotAllowed);
    EXPECT_EQ(counting->spawns.load(), 0);
}
