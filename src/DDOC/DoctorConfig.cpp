#include "DDOC/DoctorConfig.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <sstream>

namespace DDOC {

std::expected<DoctorConfig, DoctorError> parseConfig(const std::string& jsonText) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("parseConfig: malformed JSON: {}", e.what());
        return std::unexpected(DoctorError::InvalidConfig);
    }
    if (!doc.is_object()) {
        spdlog::error("parseConfig: top-level JSON value must be an object");
        return std::unexpected(DoctorError::InvalidConfig);
    }

    DoctorConfig config;
    try {
        config.adbPath = doc.value("adb_path", config.adbPath);
        config.outputDirectory = doc.value("output_directory", config.outputDirectory);
        config.commandTimeout = std::chrono::milliseconds(
            doc.value("command_timeout_ms", static_cast<int64_t>(config.commandTimeout.count())));
        config.discovery.retryDuration = std::chrono::milliseconds(
            doc.value("discovery_retry_ms", static_cast<int64_t>(config.discovery.retryDuration.count())));
        const auto maxAttempts = doc.value("discovery_max_attempts", static_cast<int64_t>(config.discovery.maxAttempts));
        if (maxAttempts < 1 || maxAttempts > std::numeric_limits<uint32_t>::max()) {
            spdlog::error("parseConfig: discovery_max_attempts out of range (got {})", maxAttempts);
            return std::unexpected(DoctorError::InvalidConfig);
        }
        config.discovery.maxAttempts = static_cast<uint32_t>(maxAttempts);
        config.logLevel = doc.value("log_level", config.logLevel);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("parseConfig: invalid field type: {}", e.what());
        return std::unexpected(DoctorError::InvalidConfig);
    }

    if (!config.isValid()) {
        spdlog::error("parseConfig: configuration failed validation");
        return std::unexpected(DoctorError::InvalidConfig);
    }
    return config;
}

std::expected<DoctorConfig, DoctorError> loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("loadConfig: cannot open '{}'", path);
        return std::unexpected(DoctorError::InvalidConfig);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    spdlog::debug("loadConfig: loaded {} bytes from '{}'", contents.str().size(), path);
    return parseConfig(contents.str());
}

} // namespace DDOC
