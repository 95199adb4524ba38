#include "DDOC/OutputParsers.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <optional>
#include <utility>

namespace DDOC::OutputParsers {

namespace {
    std::vector<std::string_view> splitLines(std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (start <= text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            std::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            if (end == text.size()) {
                break;
            }
            start = end + 1;
        }
        return lines;
    }

    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    std::size_t skipSpaces(std::string_view text, std::size_t pos) {
        while (pos < text.size() && isSpace(text[pos])) ++pos;
        return pos;
    }

    // "[ro.product.brand]: [google]" with arbitrary surrounding whitespace.
    // The key ends at the first ']', the value at the last one.
    std::optional<std::pair<std::string_view, std::string_view>> splitPropertyLine(std::string_view line) {
        std::size_t pos = skipSpaces(line, 0);
        if (pos >= line.size() || line[pos] != '[') {
            return std::nullopt;
        }
        const std::size_t keyBegin = pos + 1;
        const std::size_t keyEnd = line.find(']', keyBegin);
        if (keyEnd == std::string_view::npos) {
            return std::nullopt;
        }
        pos = skipSpaces(line, keyEnd + 1);
        if (pos >= line.size() || line[pos] != ':') {
            return std::nullopt;
        }
        pos = skipSpaces(line, pos + 1);
        if (pos >= line.size() || line[pos] != '[') {
            return std::nullopt;
        }
        const std::size_t valueBegin = pos + 1;
        std::size_t valueEnd = line.size();
        while (valueEnd > valueBegin && isSpace(line[valueEnd - 1])) --valueEnd;
        if (valueEnd <= valueBegin || line[valueEnd - 1] != ']') {
            return std::nullopt;
        }
        --valueEnd;
        return std::make_pair(line.substr(keyBegin, keyEnd - keyBegin),
                              line.substr(valueBegin, valueEnd - valueBegin));
    }
} // namespace

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

DeviceState parseDeviceState(std::string_view token) {
    if (token == "device") return DeviceState::Device;
    if (token == "offline") return DeviceState::Offline;
    if (token == "unauthorized") return DeviceState::Unauthorized;
    if (token.starts_with("no permissions")) return DeviceState::NoPermissions;
    if (token == "bootloader") return DeviceState::Bootloader;
    if (token == "recovery") return DeviceState::Recovery;
    if (token == "sideload") return DeviceState::Sideload;
    if (token == "host") return DeviceState::Host;
    return DeviceState::Unknown;
}

std::string deviceStateToString(DeviceState state) {
    switch (state) {
        case DeviceState::Device: return "device";
        case DeviceState::Offline: return "offline";
        case DeviceState::Unauthorized: return "unauthorized";
        case DeviceState::NoPermissions: return "no permissions";
        case DeviceState::Bootloader: return "bootloader";
        case DeviceState::Recovery: return "recovery";
        case DeviceState::Sideload: return "sideload";
        case DeviceState::Host: return "host";
        default: return "unknown";
    }
}

std::vector<DeviceListEntry> parseDeviceList(std::string_view text) {
    std::vector<DeviceListEntry> entries;
    bool headerSeen = false;
    for (std::string_view line : splitLines(text)) {
        if (!line.empty() && line.front() == '*') {
            spdlog::trace("parseDeviceList: skipping daemon notice '{}'", line);
            continue;
        }
        if (!headerSeen) {
            headerSeen = true;
            continue;
        }
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        std::size_t idEnd = 0;
        while (idEnd < trimmed.size() && !isSpace(trimmed[idEnd])) ++idEnd;
        const std::string rest = trim(std::string_view(trimmed).substr(idEnd));
        if (rest.empty()) {
            spdlog::debug("parseDeviceList: ignoring line without state column '{}'", trimmed);
            continue;
        }

        DeviceState state = DeviceState::Unknown;
        if (rest.starts_with("no permissions")) {
            state = DeviceState::NoPermissions;
        } else {
            std::size_t stateEnd = 0;
            while (stateEnd < rest.size() && !isSpace(rest[stateEnd])) ++stateEnd;
            state = parseDeviceState(std::string_view(rest).substr(0, stateEnd));
        }
        entries.push_back(DeviceListEntry{trimmed.substr(0, idEnd), state});
    }
    return entries;
}

DeviceProperties parseDeviceProperties(std::string_view text) {
    const auto& table = propertyTranslationTable();
    DeviceProperties properties;
    for (std::string_view line : splitLines(text)) {
        auto property = splitPropertyLine(line);
        if (!property) {
            continue;
        }
        auto it = table.find(std::string(property->first));
        if (it == table.end()) {
            continue;
        }
        properties[it->second] = std::string(property->second);
    }
    return properties;
}

bool parseBooleanSetting(std::string_view text) {
    return trim(text) == "1";
}

const std::map<std::string, std::string>& propertyTranslationTable() {
    static const std::map<std::string, std::string> table = {
        {"ro.product.brand", "product_brand"},
        {"ro.build.id", "build_id"},
        {"ro.build.type", "build_type"},
        {"ro.product.model", "product_model"},
        {"ro.product.board", "product_board"},
    };
    return table;
}

} // namespace DDOC::OutputParsers
