// include/DDOC/IProcessRunner.h
#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "DDOC/Error.h"

namespace DDOC {

/**
 * @brief Description of one external command invocation.
 */
struct CommandSpec {
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::string> workingDirectory;
    std::chrono::milliseconds timeout{30000};

    /**
     * @brief Render the command line for log messages.
     */
    std::string toString() const;
};

/**
 * @brief Result of a process that ran to completion.
 *
 * A non-zero exit code is still an outcome; only launch failures and
 * timeouts are reported as CommandFailure.
 */
struct CommandOutcome {
    int exitCode{0};
    std::string stdoutData;
};

/**
 * @brief Capability for spawning an external process and capturing its output
 *
 * Implementations must be stateless with respect to individual invocations so
 * that concurrent calls are safe. A process exceeding its timeout must be
 * terminated before run() returns.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Spawn the command, capture standard output and wait for exit
     * @param spec Executable, arguments, working directory and timeout
     * @return Exit code and captured output, or the launch/timeout failure
     */
    virtual std::expected<CommandOutcome, CommandFailure> run(const CommandSpec& spec) = 0;
};

} // namespace DDOC
