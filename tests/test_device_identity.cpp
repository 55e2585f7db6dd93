#include <gtest/gtest.h>
#include "device_identity.h"

using namespace xtrans;

TEST(DeviceIdentityTest, Construction) {
    DeviceIdentity identity("dev-1", "Kitchen tablet");

    EXPECT_TRUE(identity.is_valid());
    EXPECT_TRUE(identity.online);
    EXPECT_EQ(identity.device_type, DeviceType::DESKTOP);

    DeviceIdentity empty;
    EXPECT_FALSE(empty.is_valid());
    EXPECT_FALSE(empty.online);
}

TEST(DeviceIdentityTest, JsonRoundTripKeepsAllFields) {
    DeviceIdentity identity("dev-1", "Kitchen tablet");
    identity.device_type = DeviceType::TABLET;
    identity.platform = "linux";
    identity.browser = "firefox";
    identity.ip_address = "192.168.1.20";
    identity.last_seen = 1700000000000;

    nlohmann::json json = identity.to_json();
    EXPECT_EQ(json["deviceId"], "dev-1");
    EXPECT_EQ(json["deviceType"], "tablet");
    EXPECT_EQ(json["ipAddress"], "192.168.1.20");

    auto parsed = DeviceIdentity::from_json(json);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->device_id, "dev-1");
    EXPECT_EQ(parsed->device_name, "Kitchen tablet");
    EXPECT_EQ(parsed->device_type, DeviceType::TABLET);
    EXPECT_EQ(parsed->platform, "linux");
    EXPECT_EQ(parsed->browser, "firefox");
    EXPECT_TRUE(parsed->online);
    EXPECT_EQ(parsed->last_seen, 1700000000000);
}

TEST(DeviceIdentityTest, FromJsonToleratesMissingFields) {
    auto parsed = DeviceIdentity::from_json({{"deviceId", "dev-2"}});

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->device_id, "dev-2");
    EXPECT_TRUE(parsed->device_name.empty());
    EXPECT_EQ(parsed->device_type, DeviceType::DESKTOP);
    EXPECT_FALSE(parsed->online);
}

TEST(DeviceIdentityTest, FromJsonRejectsInvalid) {
    EXPECT_FALSE(DeviceIdentity::from_json(nlohmann::json("dev")).has_value());
    EXPECT_FALSE(DeviceIdentity::from_json({{"deviceName", "x"}}).has_value());
    EXPECT_FALSE(DeviceIdentity::from_json({{"deviceId", ""}}).has_value());
    EXPECT_FALSE(DeviceIdentity::from_json({{"deviceId", 5}}).has_value());
    EXPECT_FALSE(DeviceIdentity::from_json({{"deviceId", "dev"}, {"online", "yes"}}).has_value());
}

TEST(DeviceIdentityTest, TouchMarksOnline) {
    DeviceIdentity identity;
    identity.device_id = "dev-3";

    identity.touch();

    EXPECT_TRUE(identity.online);
    EXPECT_GT(identity.last_seen, 0);
}

TEST(DeviceIdentityTest, DeviceTypeNames) {
    EXPECT_STREQ(device_type_to_string(DeviceType::MOBILE), "mobile");
    EXPECT_EQ(device_type_from_string("tablet"), DeviceType::TABLET);
    EXPECT_EQ(device_type_from_string("toaster"), DeviceType::DESKTOP);
}
