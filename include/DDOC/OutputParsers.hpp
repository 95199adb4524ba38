#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace DDOC {

/**
 * @brief Connection state column of `adb devices`.
 */
enum class DeviceState {
    Device,        // Ready for commands
    Offline,
    Unauthorized,
    NoPermissions,
    Bootloader,
    Recovery,
    Sideload,
    Host,
    Unknown
};

struct DeviceListEntry {
    std::string deviceId;
    DeviceState state{DeviceState::Unknown};
};

/// Translated property name -> raw value, e.g. "product_brand" -> "google".
using DeviceProperties = std::map<std::string, std::string>;

namespace OutputParsers {

    /**
     * @brief Strip leading and trailing whitespace.
     */
    std::string trim(std::string_view text);

    DeviceState parseDeviceState(std::string_view token);
    std::string deviceStateToString(DeviceState state);

    /**
     * @brief Parse the output of `adb devices`.
     *
     * Daemon notices (lines starting with '*') are skipped, the first remaining
     * line is the header. Every later non-blank line yields one entry, in input
     * order; lines without a state column are ignored.
     */
    std::vector<DeviceListEntry> parseDeviceList(std::string_view text);

    /**
     * @brief Parse `getprop` output of the form "[key]: [value]".
     *
     * Only keys in the property translation table are kept. Lines that do not
     * match the bracketed shape are skipped.
     */
    DeviceProperties parseDeviceProperties(std::string_view text);

    /**
     * @brief Interpret a global settings value: true iff the trimmed text is "1".
     */
    bool parseBooleanSetting(std::string_view text);

    /**
     * @brief The recognised getprop keys and the names they are reported under.
     */
    const std::map<std::string, std::string>& propertyTranslationTable();

} // namespace OutputParsers

} // namespace DDOC
