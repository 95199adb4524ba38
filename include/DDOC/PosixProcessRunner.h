// include/DDOC/PosixProcessRunner.h
#pragma once

#include <memory>
#include <spdlog/logger.h>
#include "DDOC/IProcessRunner.h"

namespace DDOC {

/**
 * @brief IProcessRunner backed by fork/execvp and a poll loop on the child's stdout.
 *
 * Stdout is captured through a pipe; stderr is redirected to /dev/null. On
 * timeout the child receives SIGKILL and is reaped before run() returns.
 */
class PosixProcessRunner : public IProcessRunner {
public:
    explicit PosixProcessRunner(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~PosixProcessRunner() override = default;

    std::expected<CommandOutcome, CommandFailure> run(const CommandSpec& spec) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace DDOC
