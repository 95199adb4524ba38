#pragma once
#include "DDOC/Error.h"
#include "DDOC/HealthCheck.hpp"
#include "DDOC/OutputParsers.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace DDOC::JsonHelpers {
    using json = nlohmann::json;

    inline constexpr const char* kHealthCheckReportFile = "health_check_results.json";
    inline constexpr const char* kDevicePropertiesReportFile = "device_properties.json";

    json healthCheckResultToJson(const HealthCheckResult& result);
    json deviceCheckMapToJson(const DeviceCheckMap& checks);
    json devicePropertiesToJson(const DeviceProperties& properties);

    /**
     * @brief Write `document` pretty-printed to `directory/fileName`, creating the directory.
     * @return Path of the written file, or DoctorError::IOError
     */
    std::expected<std::filesystem::path, DoctorError> writeJsonReport(
        const std::filesystem::path& directory, const std::string& fileName, const json& document);
}
