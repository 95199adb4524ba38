// src/DDOC/PosixProcessRunner.cpp
#include "DDOC/PosixProcessRunner.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace DDOC {

namespace {
    constexpr int kPollSliceMs = 50;
    constexpr auto kReapSlice = std::chrono::milliseconds(10);

    // Written by the child to the status pipe when it fails before exec.
    struct LaunchErrorReport {
        int stage; // 0 = chdir, 1 = exec
        int err;
    };

    void closeFd(int& fd) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }

    [[noreturn]] void reportChildFailure(int statusFd, int stage) {
        LaunchErrorReport report{stage, errno};
        ssize_t ignored = ::write(statusFd, &report, sizeof(report));
        (void)ignored;
        _exit(127);
    }

    int decodeExitStatus(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

    void killAndReap(pid_t pid) {
        // The child leads its own process group, so this also takes out anything it spawned.
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
} // namespace

std::string CommandSpec::toString() const {
    std::string line = executable;
    for (const auto& arg : args) {
        line += ' ';
        line += arg;
    }
    return line;
}

PosixProcessRunner::PosixProcessRunner(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

std::expected<CommandOutcome, CommandFailure> PosixProcessRunner::run(const CommandSpec& spec) {
    logger_->debug("PosixProcessRunner: running '{}' (cwd: {}, timeout: {} ms)",
                   spec.toString(), spec.workingDirectory.value_or("<inherited>"), spec.timeout.count());

    int outPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        return std::unexpected(CommandFailure{DoctorError::LaunchFailed,
            "failed to create pipes: " + std::string(std::strerror(errno))});
    }
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        const int savedErrno = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return std::unexpected(CommandFailure{DoctorError::LaunchFailed,
            "failed to create pipes: " + std::string(std::strerror(savedErrno))});
    }

    // argv must be built before fork; the child may only call async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* workingDirectory = spec.workingDirectory ? spec.workingDirectory->c_str() : nullptr;

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int savedErrno = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        return std::unexpected(CommandFailure{DoctorError::LaunchFailed,
            "failed to fork: " + std::string(std::strerror(savedErrno))});
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        const int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        if (workingDirectory != nullptr && ::chdir(workingDirectory) != 0) {
            reportChildFailure(statusPipe[1], 0);
        }
        ::execvp(argv[0], argv.data());
        reportChildFailure(statusPipe[1], 1);
    }

    // Parent process
    closeFd(outPipe[1]);
    closeFd(statusPipe[1]);

    // The status pipe closes on a successful exec (O_CLOEXEC) or carries the child's errno.
    LaunchErrorReport report{};
    ssize_t reportBytes = 0;
    do {
        reportBytes = ::read(statusPipe[0], &report, sizeof(report));
    } while (reportBytes < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (reportBytes == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        std::string cause = (report.stage == 0)
            ? "Executable " + spec.executable + " could not enter working directory " +
                  spec.workingDirectory.value_or("") + ": " + std::strerror(report.err)
            : "Executable " + spec.executable + " failed to launch: " + std::strerror(report.err);
        logger_->warn("PosixProcessRunner: {}", cause);
        return std::unexpected(CommandFailure{DoctorError::LaunchFailed, std::move(cause)});
    }

    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    auto timeoutFailure = [&]() {
        std::string cause = "Executable " + spec.executable + " timed out after " +
                            std::to_string(spec.timeout.count()) + " ms.";
        logger_->warn("PosixProcessRunner: {}", cause);
        return CommandFailure{DoctorError::Timeout, std::move(cause)};
    };

    CommandOutcome outcome;
    std::array<char, 4096> buffer{};
    bool eof = false;
    while (!eof) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            closeFd(outPipe[0]);
            killAndReap(pid);
            return std::unexpected(timeoutFailure());
        }

        struct pollfd pfd{};
        pfd.fd = outPipe[0];
        pfd.events = POLLIN;
        const int sliceMs = static_cast<int>(std::min<long long>(remaining.count(), kPollSliceMs));
        const int pollResult = ::poll(&pfd, 1, sliceMs);
        if (pollResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int savedErrno = errno;
            closeFd(outPipe[0]);
            killAndReap(pid);
            return std::unexpected(CommandFailure{DoctorError::LaunchFailed,
                "poll failed: " + std::string(std::strerror(savedErrno))});
        }
        if (pollResult == 0) {
            continue;
        }

        const ssize_t bytes = ::read(outPipe[0], buffer.data(), buffer.size());
        if (bytes > 0) {
            outcome.stdoutData.append(buffer.data(), static_cast<std::size_t>(bytes));
        } else if (bytes == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof = true;
        }
    }
    closeFd(outPipe[0]);

    // Stdout is closed; wait for the exit status within what is left of the timeout.
    while (true) {
        int status = 0;
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            outcome.exitCode = decodeExitStatus(status);
            break;
        }
        if (waited < 0 && errno != EINTR) {
            const int savedErrno = errno;
            return std::unexpected(CommandFailure{DoctorError::LaunchFailed,
                "waitpid failed: " + std::string(std::strerror(savedErrno))});
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            killAndReap(pid);
            return std::unexpected(timeoutFailure());
        }
        std::this_thread::sleep_for(kReapSlice);
    }

    logger_->debug("PosixProcessRunner: '{}' exited with code {} ({} bytes of output)",
                   spec.executable, outcome.exitCode, outcome.stdoutData.size());
    return outcome;
}

} // namespace DDOC
