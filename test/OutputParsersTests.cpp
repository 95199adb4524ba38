#include <gtest/gtest.h>
#include "DDOC/OutputParsers.hpp"
#include <string>

using namespace DDOC;

TEST(ParseDeviceListTest, HeaderOnlyYieldsNoEntries) {
    EXPECT_TRUE(OutputParsers::parseDeviceList("List of devices attached\n").empty());
    EXPECT_TRUE(OutputParsers::parseDeviceList("List of devices attached").empty());
    EXPECT_TRUE(OutputParsers::parseDeviceList("").empty());
}

TEST(ParseDeviceListTest, ParsesIdsAndStatesInOrder) {
    const std::string output =
        "List of devices attached\n"
        "ZY223JQNMR      device\n"
        "emulator-5554\toffline\n"
        "\n"
        "R58M42ABCDE\tunauthorized\n"
        "0123456789\tdevice\n";

    auto entries = OutputParsers::parseDeviceList(output);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].deviceId, "ZY223JQNMR");
    EXPECT_EQ(entries[0].state, DeviceState::Device);
    EXPECT_EQ(entries[1].deviceId, "emulator-5554");
    EXPECT_EQ(entries[1].state, DeviceState::Offline);
    EXPECT_EQ(entries[2].deviceId, "R58M42ABCDE");
    EXPECT_EQ(entries[2].state, DeviceState::Unauthorized);
    EXPECT_EQ(entries[3].deviceId, "0123456789");
    EXPECT_EQ(entries[3].state, DeviceState::Device);
}

TEST(ParseDeviceListTest, SkipsDaemonNoticesBeforeHeader) {
    const std::string output =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "ZY223JQNMR\tdevice\n";

    auto entries = OutputParsers::parseDeviceList(output);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].deviceId, "ZY223JQNMR");
}

TEST(ParseDeviceListTest, HandlesCarriageReturnsAndLongFormat) {
    const std::string output =
        "List of devices attached\r\n"
        "ZY223JQNMR  device usb:1-1 product:foo model:bar transport_id:1\r\n";

    auto entries = OutputParsers::parseDeviceList(output);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].deviceId, "ZY223JQNMR");
    EXPECT_EQ(entries[0].state, DeviceState::Device);
}

TEST(ParseDeviceListTest, RecognisesNoPermissionsState) {
    const std::string output =
        "List of devices attached\n"
        "0123456789ABCDEF\tno permissions (user in plugdev group; are your udev rules wrong?)\n";

    auto entries = OutputParsers::parseDeviceList(output);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].state, DeviceState::NoPermissions);
}

TEST(ParseDeviceListTest, IgnoresLinesWithoutState) {
    auto entries = OutputParsers::parseDeviceList("List of devices attached\nlonely-token\n");
    EXPECT_TRUE(entries.empty());
}

TEST(ParseDeviceStateTest, UnknownTokensMapToUnknown) {
    EXPECT_EQ(OutputParsers::parseDeviceState("device"), DeviceState::Device);
    EXPECT_EQ(OutputParsers::parseDeviceState("recovery"), DeviceState::Recovery);
    EXPECT_EQ(OutputParsers::parseDeviceState("sideload"), DeviceState::Sideload);
    EXPECT_EQ(OutputParsers::parseDeviceState("bogus"), DeviceState::Unknown);
    EXPECT_EQ(OutputParsers::deviceStateToString(DeviceState::Unauthorized), "unauthorized");
    EXPECT_EQ(OutputParsers::deviceStateToString(DeviceState::Unknown), "unknown");
}

TEST(ParseDevicePropertiesTest, TranslatesRecognisedKeysOnly) {
    const std::string output =
        "[ro.product.brand]: [abc]\n"
        "      [ro.build.id]: [def]\n"
        "      [ro.build.type]: [ghi]\n"
        "[persist.sys.timezone]: [Europe/Berlin]\n"
        "      [ro.product.model]: [jkl]\n"
        "      [ro.product.board]: [mno]\n"
        "      \n";

    const DeviceProperties expected = {
        {"product_brand", "abc"},
        {"build_id", "def"},
        {"build_type", "ghi"},
        {"product_model", "jkl"},
        {"product_board", "mno"},
    };
    EXPECT_EQ(OutputParsers::parseDeviceProperties(output), expected);
}

TEST(ParseDevicePropertiesTest, KeepsValueVerbatimAndSkipsMalformedLines) {
    const std::string output =
        "[ro.product.model]: [ Pixel 7 [beta] ]\n"
        "[ro.build.id] [missing-colon]\n"
        "ro.product.brand: google\n"
        "[ro.product.board]:[]\n";

    auto properties = OutputParsers::parseDeviceProperties(output);
    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties.at("product_model"), " Pixel 7 [beta] ");
    EXPECT_EQ(properties.at("product_board"), "");
    EXPECT_EQ(properties.count("build_id"), 0u);
    EXPECT_EQ(properties.count("product_brand"), 0u);
}

TEST(ParseDevicePropertiesTest, MegabyteValueDoesNotDisturbNeighbouringKeys) {
    const std::string output =
        "[ro.product.brand]: [abc]\n"
        "[ro.boot.vbmeta.digest]: [" + std::string(2 * 1024 * 1024, 'a') + "]\n"
        "[ro.build.id]: [def]\n";

    auto properties = OutputParsers::parseDeviceProperties(output);
    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties.at("product_brand"), "abc");
    EXPECT_EQ(properties.at("build_id"), "def");
}

TEST(ParseDevicePropertiesTest, ToleratesWhitespaceAroundBrackets) {
    auto properties = OutputParsers::parseDeviceProperties(
        "  [ro.build.type] :  [userdebug]  \r\n"
        "[ro.product.model]: [unterminated\n");
    ASSERT_EQ(properties.size(), 1u);
    EXPECT_EQ(properties.at("build_type"), "userdebug");
}

TEST(ParseDevicePropertiesTest, EmptyInputYieldsEmptyMap) {
    EXPECT_TRUE(OutputParsers::parseDeviceProperties("").empty());
    EXPECT_TRUE(OutputParsers::parseDeviceProperties("List of devices attached").empty());
}

TEST(ParseBooleanSettingTest, OnlyTrimmedOneIsTrue) {
    EXPECT_TRUE(OutputParsers::parseBooleanSetting("1"));
    EXPECT_TRUE(OutputParsers::parseBooleanSetting("1\n"));
    EXPECT_TRUE(OutputParsers::parseBooleanSetting("  1\r\n"));
    EXPECT_FALSE(OutputParsers::parseBooleanSetting("0"));
    EXPECT_FALSE(OutputParsers::parseBooleanSetting("null"));
    EXPECT_FALSE(OutputParsers::parseBooleanSetting(""));
    EXPECT_FALSE(OutputParsers::parseBooleanSetting("11"));
}

TEST(TrimTest, StripsSurroundingWhitespace) {
    EXPECT_EQ(OutputParsers::trim("  abc \t\n"), "abc");
    EXPECT_EQ(OutputParsers::trim("   "), "");
    EXPECT_EQ(OutputParsers::trim("a b"), "a b");
}
