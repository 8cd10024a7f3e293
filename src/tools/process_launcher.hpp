#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::tools {

struct LaunchSpec {
    std::vector<std::string> argv;  // argv[0] is the program name
    std::filesystem::path working_directory;
    std::vector<std::string> environment;  // NAME=value, the complete child environment
    std::chrono::milliseconds timeout{0};
    bool capture_output = true;
};

struct ProcessOutcome {
    enum class State {
        Exited,
        TimedOut,
        SpawnFailed
    };

    State state = State::SpawnFailed;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string spawn_error;
    std::chrono::milliseconds duration{0};
    bool output_truncated = false;
};

// Seam between CommandGuard and the operating system.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual ProcessOutcome launch(const LaunchSpec& spec) = 0;
};

// fork/execve without a shell. The child leads its own process group so a
// timeout can kill everything it spawned.
class PosixProcessLauncher : public ProcessLauncher {
public:
    static constexpr std::size_t kMaxCaptureBytes = 8 * 1024 * 1024;

    ProcessOutcome launch(const LaunchSpec& spec) override;

    // PATH lookup; programs containing '/' are taken as given.
    static std::optional<std::filesystem::path> resolve_executable(
        const std::string& program, const std::string& search_path);
};

}  // namespace trustgate::tools
