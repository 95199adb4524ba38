#include "DDOC/HealthCheck.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace DDOC {

HealthCheckResult::HealthCheckResult(std::string name, bool succeeded, std::string details)
    : name_(std::move(name))
    , succeeded_(succeeded)
    , details_(std::move(details))
{
}

HealthCheckResult HealthCheckResult::success(std::string name, std::string details) {
    return HealthCheckResult(std::move(name), true, std::move(details));
}

HealthCheckResult HealthCheckResult::failure(std::string name, std::string details) {
    if (details.empty()) {
        details = "unknown failure";
    }
    return HealthCheckResult(std::move(name), false, std::move(details));
}

std::string formatExitCodeFailure(const std::string& executable, int exitCode) {
    return fmt::format("Executable {} failed with exit code {}.", executable, exitCode);
}

} // namespace DDOC
