#include "tools/process_launcher.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace trustgate::tools {

namespace {

constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";
constexpr int kPollSliceMs = 20;
constexpr auto kKillGrace = std::chrono::milliseconds(200);

enum class ChildStage : int {
    Chdir = 1,
    Exec = 2
};

struct ChildFailure {
    int stage = 0;
    int error = 0;
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(const int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(const int fd = -1) {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

// Close-on-exec so concurrent launches never inherit each other's pipes.
bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Owns a forked child until it has been reaped. Destruction on any early
// return kills the whole process group and waits for the leader.
class ChildProcess {
public:
    explicit ChildProcess(const pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (!reaped_) {
            kill_group();
            wait();
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool reaped() const { return reaped_; }
    int status() const { return status_; }

    bool poll_exit() {
        if (reaped_) {
            return true;
        }
        const pid_t waited = waitpid(pid_, &status_, WNOHANG);
        if (waited == pid_ || (waited < 0 && errno == ECHILD)) {
            reaped_ = true;
        }
        return reaped_;
    }

    void wait() {
        while (!reaped_) {
            const pid_t waited = waitpid(pid_, &status_, 0);
            if (waited == pid_ || (waited < 0 && errno != EINTR)) {
                reaped_ = true;
            }
        }
    }

    void kill_group() const {
        static_cast<void>(killpg(pid_, SIGKILL));
        if (!reaped_) {
            static_cast<void>(kill(pid_, SIGKILL));
        }
    }

private:
    pid_t pid_;
    int status_ = 0;
    bool reaped_ = false;
};

void append_limited(std::string& out, const char* data, const std::size_t size,
                    bool& truncated) {
    const std::size_t limit = PosixProcessLauncher::kMaxCaptureBytes;
    const std::size_t room = out.size() < limit ? limit - out.size() : 0;
    const std::size_t take = std::min(size, room);
    out.append(data, take);
    if (take < size) {
        truncated = true;
    }
}

void drain_pipe(UniqueFd& fd, std::string& out, bool& truncated) {
    if (!fd.valid()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            append_limited(out, buffer, static_cast<std::size_t>(n), truncated);
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        fd.reset();
        return;
    }
}

std::string search_path_of(const std::vector<std::string>& environment) {
    for (const auto& entry : environment) {
        if (entry.rfind("PATH=", 0) == 0) {
            return entry.substr(5);
        }
    }
    return kDefaultSearchPath;
}

std::vector<char*> to_c_strings(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

[[noreturn]] void fail_child(const int status_fd, const ChildStage stage) {
    const ChildFailure failure{static_cast<int>(stage), errno};
    static_cast<void>(write(status_fd, &failure, sizeof(failure)));
    _exit(127);
}

std::string describe_child_failure(const ChildFailure& failure,
                                   const LaunchSpec& spec) {
    std::ostringstream out;
    if (failure.stage == static_cast<int>(ChildStage::Chdir)) {
        out << "Unable to enter working directory: " << std::strerror(failure.error);
    } else {
        out << "Unable to execute '" << spec.argv.front()
            << "': " << std::strerror(failure.error);
    }
    return out.str();
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

}  // namespace

std::optional<std::filesystem::path> PosixProcessLauncher::resolve_executable(
    const std::string& program, const std::string& search_path) {
    if (program.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) && !ec &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (program.find('/') != std::string::npos) {
        if (is_executable(program)) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    std::istringstream directories(search_path);
    std::string directory;
    while (std::getline(directories, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(directory) / program;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ProcessOutcome PosixProcessLauncher::launch(const LaunchSpec& spec) {
    ProcessOutcome outcome;
    const auto started = std::chrono::steady_clock::now();
    if (spec.argv.empty()) {
        outcome.spawn_error = "Empty argument vector.";
        return outcome;
    }

    const auto executable = resolve_executable(spec.argv.front(), search_path_of(spec.environment));
    if (!executable.has_value()) {
        outcome.spawn_error = "Executable not found: " + spec.argv.front();
        return outcome;
    }

    // Everything the child touches is prepared before fork.
    std::string executable_path = executable->string();
    std::string working_directory = spec.working_directory.string();
    std::vector<std::string> argv_storage = spec.argv;
    std::vector<std::string> env_storage = spec.environment;
    std::vector<char*> argv = to_c_strings(argv_storage);
    std::vector<char*> envp = to_c_strings(env_storage);

    UniqueFd stdout_read;
    UniqueFd stdout_write;
    UniqueFd stderr_read;
    UniqueFd stderr_write;
    UniqueFd status_read;
    UniqueFd status_write;
    UniqueFd null_fd(open("/dev/null", O_RDWR | O_CLOEXEC));
    if (!null_fd.valid() || !make_pipe(status_read, status_write) ||
        (spec.capture_output && (!make_pipe(stdout_read, stdout_write) ||
                                 !make_pipe(stderr_read, stderr_write)))) {
        outcome.spawn_error = std::string("Failed to create process pipes: ") +
                              std::strerror(errno);
        return outcome;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        outcome.spawn_error = std::string("Failed to fork process: ") + std::strerror(errno);
        return outcome;
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(null_fd.get(), STDIN_FILENO));
        if (spec.capture_output) {
            static_cast<void>(dup2(stdout_write.get(), STDOUT_FILENO));
            static_cast<void>(dup2(stderr_write.get(), STDERR_FILENO));
        } else {
            static_cast<void>(dup2(null_fd.get(), STDOUT_FILENO));
            static_cast<void>(dup2(null_fd.get(), STDERR_FILENO));
        }
        if (chdir(working_directory.c_str()) != 0) {
            fail_child(status_write.get(), ChildStage::Chdir);
        }
        execve(executable_path.c_str(), argv.data(), envp.data());
        fail_child(status_write.get(), ChildStage::Exec);
    }

    ChildProcess child(pid);
    static_cast<void>(setpgid(pid, pid));
    stdout_write.reset();
    stderr_write.reset();
    status_write.reset();
    null_fd.reset();

    // The status pipe closes on a successful exec; bytes mean chdir or exec failed.
    ChildFailure failure;
    ssize_t status_bytes = -1;
    do {
        status_bytes = read(status_read.get(), &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    if (status_bytes > 0) {
        child.wait();
        outcome.spawn_error = describe_child_failure(failure, spec);
        outcome.duration = elapsed_since(started);
        return outcome;
    }

    if (stdout_read.valid()) {
        set_nonblocking(stdout_read.get());
    }
    if (stderr_read.valid()) {
        set_nonblocking(stderr_read.get());
    }

    const auto deadline = started + spec.timeout;
    bool timed_out = false;
    bool killed = false;

    while (stdout_read.valid() || stderr_read.valid() || !child.reaped()) {
        const auto now = std::chrono::steady_clock::now();
        if (!killed && now >= deadline) {
            // A leader that already exited finished in time; only the
            // descendants still holding the pipes are cut off.
            timed_out = !child.reaped();
            killed = true;
            child.kill_group();
        }
        if (killed && now >= deadline + kKillGrace) {
            break;
        }

        int slice_ms = kPollSliceMs;
        if (!killed) {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            slice_ms = static_cast<int>(std::max<long long>(
                1, std::min<long long>(kPollSliceMs, remaining)));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_read.valid()) {
            fds[nfds].fd = stdout_read.get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stderr_read.valid()) {
            fds[nfds].fd = stderr_read.get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds, slice_ms));

        drain_pipe(stdout_read, outcome.stdout_text, outcome.output_truncated);
        drain_pipe(stderr_read, outcome.stderr_text, outcome.output_truncated);
        child.poll_exit();
    }

    child.wait();
    outcome.duration = elapsed_since(started);

    if (timed_out) {
        outcome.state = ProcessOutcome::State::TimedOut;
        return outcome;
    }

    const int status = child.status();
    outcome.state = ProcessOutcome::State::Exited;
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }
    return outcome;
}

}  // namespace trustgate::tools
