#include <gtest/gtest.h>
#include <device/device_output.hpp>
#include <device/keys.hpp>
#include <core/constants.hpp>

TEST(UpdateOutputTest, FullLine) {
    auto out = parse_update_output("playing com.netflix.ninja 7 0\n");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state_token, "playing");
    EXPECT_EQ(out->current_app, "com.netflix.ninja");
    EXPECT_EQ(out->volume, 7);
    EXPECT_EQ(out->muted, false);
    EXPECT_TRUE(out->running_apps.empty());
}

TEST(UpdateOutputTest, DashesAreMissingFields) {
    auto out = parse_update_output("off - - 0");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state_token, "off");
    EXPECT_FALSE(out->current_app.has_value());
    EXPECT_FALSE(out->volume.has_value());
    EXPECT_EQ(out->muted, false);
}

TEST(UpdateOutputTest, MutedCount) {
    auto out = parse_update_output("idle - 3 2");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->muted, true);
}

TEST(UpdateOutputTest, NumericStateTokenIsKeptRaw) {
    auto out = parse_update_output("1 com.app.foo 3");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state_token, "1");
    EXPECT_EQ(out->current_app, "com.app.foo");
    EXPECT_EQ(out->volume, 3);
    EXPECT_FALSE(out->muted.has_value());
}

TEST(UpdateOutputTest, VolumeClampedAndGarbageIgnored) {
    auto high = parse_update_output("idle - 40 0");
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->volume, MAX_VOLUME_LEVEL);

    auto garbage = parse_update_output("idle - null 0");
    ASSERT_TRUE(garbage.has_value());
    EXPECT_FALSE(garbage->volume.has_value());
}

TEST(UpdateOutputTest, RunningAppsFollowFirstLine) {
    auto out = parse_update_output("\r\nplaying com.amazon.tv 5 0\r\ncom.amazon.tv\n\ncom.netflix.ninja\n");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state_token, "playing");
    ASSERT_EQ(out->running_apps.size(), 2u);
    EXPECT_EQ(out->running_apps[0], "com.amazon.tv");
    EXPECT_EQ(out->running_apps[1], "com.netflix.ninja");
}

TEST(UpdateOutputTest, EmptyOutput) {
    EXPECT_FALSE(parse_update_output("").has_value());
    EXPECT_FALSE(parse_update_output("  \n\r\n").has_value());
}

TEST(PropertiesTest, AllFields) {
    auto props = parse_properties("G070VM1234\nAmazon\nAFTMM\n9\nAA:BB:CC:DD:EE:FF\n");
    EXPECT_EQ(props["serialno"], "G070VM1234");
    EXPECT_EQ(props["manufacturer"], "Amazon");
    EXPECT_EQ(props["model"], "AFTMM");
    EXPECT_EQ(props["sw_version"], "9");
    EXPECT_EQ(props["wifimac"], "aa:bb:cc:dd:ee:ff");
}

TEST(PropertiesTest, MissingTrailingLines) {
    auto props = parse_properties("SERIAL\nGoogle\n");
    EXPECT_EQ(props.size(), 2u);
    EXPECT_EQ(props.count("wifimac"), 0u);
}

TEST(PropertiesTest, EmptyLinesSkipped) {
    auto props = parse_properties("\nSony\nBRAVIA\n\n");
    EXPECT_EQ(props.count("serialno"), 0u);
    EXPECT_EQ(props["manufacturer"], "Sony");
    EXPECT_EQ(props["model"], "BRAVIA");
    EXPECT_EQ(props.count("sw_version"), 0u);
}

TEST(FormatStatusTest, Unavailable) {
    DeviceStatus status;
    EXPECT_EQ(format_status(status), "state: unavailable\n");
}

TEST(FormatStatusTest, AllFields) {
    DeviceStatus status;
    status.state = DeviceState::PLAYING;
    status.current_app = "com.netflix.ninja";
    status.app_name = "Netflix";
    status.volume = 5;
    status.is_volume_muted = false;

    std::string text = format_status(status);
    EXPECT_NE(text.find("state: playing"), std::string::npos);
    EXPECT_NE(text.find("app: com.netflix.ninja (Netflix)"), std::string::npos);
    EXPECT_NE(text.find("volume: 5/15"), std::string::npos);
    EXPECT_NE(text.find("muted: no"), std::string::npos);
}

TEST(KeysTest, Lookup) {
    EXPECT_EQ(key_code("HOME"), 3);
    EXPECT_EQ(key_code("POWER"), 26);
    EXPECT_EQ(key_code("SLEEP"), 223);
    EXPECT_EQ(key_code("WAKEUP"), 224);
    EXPECT_FALSE(key_code("home").has_value());
    EXPECT_FALSE(key_code("ls").has_value());
}
