#include "DDOC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace DDOC::JsonHelpers {
    json healthCheckResultToJson(const HealthCheckResult& result) {
        json j;
        j["name"] = result.getName();
        j["succeeded"] = result.succeeded();
        if (!result.getDetails().empty()) {
            j["details"] = result.getDetails();
        }
        return j;
    }

    json deviceCheckMapToJson(const DeviceCheckMap& checks) {
        json j = json::object();
        for (const auto& [deviceId, results] : checks) {
            json list = json::array();
            for (const auto& result : results) {
                list.push_back(healthCheckResultToJson(result));
            }
            j[deviceId] = std::move(list);
        }
        return j;
    }

    json devicePropertiesToJson(const DeviceProperties& properties) {
        json j = json::object();
        for (const auto& [key, value] : properties) {
            j[key] = value;
        }
        return j;
    }

    std::expected<std::filesystem::path, DoctorError> writeJsonReport(
        const std::filesystem::path& directory, const std::string& fileName, const json& document)
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            spdlog::error("writeJsonReport: cannot create '{}': {}", directory.string(), ec.message());
            return std::unexpected(DoctorError::IOError);
        }

        const auto path = directory / fileName;
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            spdlog::error("writeJsonReport: cannot open '{}' for writing", path.string());
            return std::unexpected(DoctorError::IOError);
        }
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
            spdlog::error("writeJsonReport: write to '{}' failed", path.string());
            return std::unexpected(DoctorError::IOError);
        }
        spdlog::info("Report written to {}", path.string());
        return path;
    }
}
