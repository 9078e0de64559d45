/**
 * @file test_device_record.cpp
 * @brief Unit tests for DeviceRecord merging and JSON rendering
 */

#include <gtest/gtest.h>
#include <ubnt/core/device_record.hpp>

#include <string>
#include <vector>

using namespace ubnt::core;

class DeviceRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = DeviceRecord("192.168.1.20");
        base_.hw_addr = "aa:bb:cc:dd:ee:ff";
        base_.hostname = "office";
        base_.platform = "U6-Lite";
        base_.uptime = 100;
        base_.ip_info = std::vector<std::string>{"aa:bb:cc:dd:ee:ff;192.168.1.20"};
        base_.signature_version = "1";
    }

    DeviceRecord base_;
};

TEST_F(DeviceRecordTest, DefaultsAreAbsent) {
    DeviceRecord record("10.0.0.1");
    EXPECT_EQ(record.source_ip, "10.0.0.1");
    EXPECT_FALSE(record.hw_addr.has_value());
    EXPECT_FALSE(record.ip_info.has_value());
    EXPECT_FALSE(record.uptime.has_value());
    EXPECT_FALSE(record.is_sso_enabled.has_value());
    EXPECT_TRUE(record.services.empty());
}

TEST_F(DeviceRecordTest, MergeNonNullFieldsWin) {
    DeviceRecord newer("192.168.1.20");
    newer.hostname = "lobby";
    newer.uptime = 160;
    newer.fw_version = "6.5.28";

    base_.mergeFrom(newer);

    EXPECT_EQ(base_.hostname, std::optional<std::string>("lobby"));
    EXPECT_EQ(base_.uptime, std::optional<uint32_t>(160));
    EXPECT_EQ(base_.fw_version, std::optional<std::string>("6.5.28"));
}

TEST_F(DeviceRecordTest, MergeNullFieldsKeepCurrent) {
    DeviceRecord newer("192.168.1.20");

    DeviceRecord before = base_;
    base_.mergeFrom(newer);

    EXPECT_EQ(base_, before);
}

TEST_F(DeviceRecordTest, MergeReplacesIpInfoWholesale) {
    DeviceRecord newer("192.168.1.20");
    newer.ip_info = std::vector<std::string>{"aa:bb:cc:dd:ee:ff;10.0.0.20"};

    base_.mergeFrom(newer);

    ASSERT_TRUE(base_.ip_info.has_value());
    ASSERT_EQ(base_.ip_info->size(), 1u);
    EXPECT_EQ(base_.ip_info->front(), "aa:bb:cc:dd:ee:ff;10.0.0.20");
}

TEST_F(DeviceRecordTest, MergeServicesOverwriteKeys) {
    base_.services[Service::PROTECT] = false;

    DeviceRecord newer("192.168.1.20");
    newer.services[Service::PROTECT] = true;
    base_.mergeFrom(newer);

    EXPECT_TRUE(base_.services.at(Service::PROTECT));
}

TEST_F(DeviceRecordTest, MergeKeepsHwAddrAndMacAddressIndependent) {
    DeviceRecord newer("192.168.1.20");
    newer.mac_address = "11:22:33:44:55:66";
    base_.mergeFrom(newer);

    EXPECT_EQ(base_.hw_addr, std::optional<std::string>("aa:bb:cc:dd:ee:ff"));
    EXPECT_EQ(base_.mac_address, std::optional<std::string>("11:22:33:44:55:66"));
}

TEST_F(DeviceRecordTest, Equality) {
    DeviceRecord copy = base_;
    EXPECT_EQ(copy, base_);

    copy.is_single_user = false;
    EXPECT_NE(copy, base_);
}

TEST_F(DeviceRecordTest, ServiceNames) {
    EXPECT_STREQ(serviceToString(Service::PROTECT), "Protect");
}

// =============================================================================
// JSON
// =============================================================================

TEST_F(DeviceRecordTest, JsonRendersAbsentFieldsAsNull) {
    nlohmann::json json = toJson(DeviceRecord("10.0.0.1"));

    EXPECT_EQ(json["source_ip"], "10.0.0.1");
    EXPECT_TRUE(json["hw_addr"].is_null());
    EXPECT_TRUE(json["ip_info"].is_null());
    EXPECT_TRUE(json["uptime"].is_null());
    EXPECT_TRUE(json["is_sso_enabled"].is_null());
    ASSERT_TRUE(json["services"].is_object());
    EXPECT_TRUE(json["services"].empty());
}

TEST_F(DeviceRecordTest, JsonRendersPresentFields) {
    base_.services[Service::PROTECT] = true;
    base_.is_sso_enabled = true;
    nlohmann::json json = toJson(base_);

    EXPECT_EQ(json["hw_addr"], "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(json["uptime"], 100);
    ASSERT_TRUE(json["ip_info"].is_array());
    EXPECT_EQ(json["ip_info"][0], "aa:bb:cc:dd:ee:ff;192.168.1.20");
    EXPECT_EQ(json["services"]["Protect"], true);
    EXPECT_EQ(json["is_sso_enabled"], true);
    EXPECT_EQ(json["signature_version"], "1");
}
