#include <pdfledger/tools/process_runner.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pdfledger::tools {

namespace {

constexpr int kExecFailedStatus = 127;

int waitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Result<ProcessResult> runProcess(const ProcessSpec& spec) {
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        return Error{ErrorCode::InternalError,
                     fmt::format("pipe() failed: {}", std::strerror(errno))};
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::string workdir = spec.workdir ? spec.workdir->string() : std::string();

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return Error{ErrorCode::InternalError,
                     fmt::format("fork() failed: {}", std::strerror(errno))};
    }

    if (pid == 0) {
        // Child process
        dup2(pipefd[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            _exit(kExecFailedStatus);
        }
        execvp(argv[0], argv.data());
        _exit(kExecFailedStatus);
    }

    // Parent process
    close(pipefd[1]);

    ProcessResult result;
    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t n = read(pipefd[0], buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::warn("Failed reading output of {}: {}", spec.executable, std::strerror(errno));
            break;
        }
    }
    close(pipefd[0]);

    result.exitCode = waitForChild(pid);
    if (result.exitCode == kExecFailedStatus && result.output.empty()) {
        return Error{ErrorCode::ToolUnavailable,
                     fmt::format("Could not execute {}", spec.executable)};
    }
    spdlog::trace("{} exited with {}", spec.executable, result.exitCode);
    return result;
}

std::optional<std::filesystem::path> findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }

    std::string_view paths(pathEnv);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        auto dir = paths.substr(start, colon == std::string_view::npos ? std::string_view::npos
                                                                       : colon - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(std::string(dir)) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }
    return std::nullopt;
}

} // namespace pdfledger::tools
