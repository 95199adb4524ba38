// include/DDOC/Error.h
// Synopsis: Error codes for command execution, discovery and reporting.

#pragma once

#include <string>
#include <system_error>

namespace DDOC {

enum class DoctorError {
    Success = 0,         // Operation completed successfully
    LaunchFailed = 1,    // Process could not be started
    Timeout = 2,         // Process exceeded its timeout and was killed
    NonZeroExit = 3,     // Command ran but exited with a non-zero code
    BuildFailed = 4,     // Device discovery exhausted its retries
    RecoveryFailed = 5,  // At least one device could not be recovered
    InvalidConfig = 6,   // Configuration unreadable or malformed
    IOError = 7          // File I/O failure
};

// Make DoctorError work with std::error_code
namespace detail {
    struct DoctorErrorCategory : std::error_category {
        const char* name() const noexcept override { return "DeviceDoctor"; }
        std::string message(int ev) const override {
            switch (static_cast<DoctorError>(ev)) {
                case DoctorError::Success: return "Success";
                case DoctorError::LaunchFailed: return "Process launch failed";
                case DoctorError::Timeout: return "Process timed out";
                case DoctorError::NonZeroExit: return "Process exited with non-zero code";
                case DoctorError::BuildFailed: return "Device discovery failed after retries";
                case DoctorError::RecoveryFailed: return "Device recovery failed";
                case DoctorError::InvalidConfig: return "Invalid configuration";
                case DoctorError::IOError: return "I/O error";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& doctor_error_category() noexcept {
    static detail::DoctorErrorCategory category;
    return category;
}

inline std::error_code make_error_code(DoctorError e) noexcept {
    return {static_cast<int>(e), doctor_error_category()};
}

/**
 * @brief Failure of a single process invocation (launch error or timeout).
 *
 * Carries the error class together with the underlying cause text so callers
 * can report it verbatim.
 */
struct CommandFailure {
    DoctorError error{DoctorError::LaunchFailed};
    std::string cause;
};

} // namespace DDOC

namespace std {
    template<>
    struct is_error_code_enum<DDOC::DoctorError> : true_type {};
}
