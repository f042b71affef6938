#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/discovery/OuiClassifier.h"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace cam_scan {

class OuiClassifierTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_path_.empty()) std::remove(temp_path_.c_str());
    }

    std::string write_temp(const std::string& content) {
        char tmpl[] = "/tmp/cam_scan_oui_XXXXXX";
        int fd = mkstemp(tmpl);
        EXPECT_GE(fd, 0);
        if (fd >= 0) close(fd);
        temp_path_ = tmpl;
        std::ofstream out(temp_path_);
        out << content;
        return temp_path_;
    }

    std::string temp_path_;
};

TEST_F(OuiClassifierTest, KnownCameraOui) {
    OuiClassifier c;
    auto r = c.classify(std::string("A0:CF:5B:11:22:33"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Hikvision"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Camera));
}

TEST_F(OuiClassifierTest, LowercaseAndHyphenatedMac) {
    OuiClassifier c;
    auto r = c.classify(std::string("3c-ef-8c-00-00-01"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Dahua"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Camera));
}

TEST_F(OuiClassifierTest, KnownInfrastructureOui) {
    OuiClassifier c;
    auto r = c.classify(std::string("00:00:0C:AA:BB:CC"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Cisco"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Infrastructure));
}

TEST_F(OuiClassifierTest, UnlistedAndAbsentMac) {
    OuiClassifier c;
    auto r = c.classify(std::string("12:34:56:78:9A:BC"));
    EXPECT_FALSE(r.manufacturer.has_value());
    EXPECT_FALSE(r.device_class.has_value());

    auto none = c.classify(std::nullopt);
    EXPECT_FALSE(none.manufacturer.has_value());
    EXPECT_FALSE(none.device_class.has_value());

    auto short_mac = c.classify(std::string("A0:CF"));
    EXPECT_FALSE(short_mac.device_class.has_value());
}

TEST_F(OuiClassifierTest, OuiInBothTablesIsCamera) {
    OuiClassifier c;
    // Ubiquiti blocks appear in both built-in tables
    auto r = c.classify(std::string("24:A4:3C:01:02:03"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Ubiquiti"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Camera));

    OuiClassifier custom({{"AA:BB:CC", "CamCo"}}, {{"AA:BB:CC", "NetCo"}});
    auto r2 = custom.classify(std::string("AA:BB:CC:00:00:01"));
    EXPECT_EQ(r2.manufacturer, std::optional<std::string>("CamCo"));
    EXPECT_EQ(r2.device_class, std::optional<DeviceClass>(DeviceClass::Camera));
}

TEST_F(OuiClassifierTest, DuplicateCameraOuiLastWriteWins) {
    OuiClassifier c;
    auto r = c.classify(std::string("9C:8E:CD:00:00:01"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Amcrest"));
    EXPECT_THAT(c.duplicate_ouis(), ::testing::Contains("9C:8E:CD"));
}

TEST_F(OuiClassifierTest, AddOverridesAndValidates) {
    OuiClassifier c({}, {});
    EXPECT_EQ(c.camera_count(), 0u);
    c.add(DeviceClass::Infrastructure, "de:ad:be", "Example Networks");
    EXPECT_EQ(c.infrastructure_count(), 1u);
    auto r = c.classify(std::string("DE:AD:BE:EF:00:01"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Infrastructure));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Example Networks"));

    EXPECT_THROW(c.add(DeviceClass::Camera, "DE:AD", "Short"), std::invalid_argument);
    EXPECT_THROW(c.add(DeviceClass::Unknown, "DE:AD:BF", "Nobody"), std::invalid_argument);
}

TEST_F(OuiClassifierTest, LoadFileExtendsTables) {
    auto path = write_temp(
        "# site additions\n"
        "\n"
        "camera, 11:22:33, Acme Cams\n"
        "infrastructure,44-55-66,Acme Switches\r\n"
        "camera,A0:CF:5B,Relabelled\n"
        "bogus line\n"
        "unknown,77:88:99,Nope\n"
        "camera,77:88,Short\n"
        "camera,77:88:99,\n");
    OuiClassifier c;
    size_t cams = c.camera_count();
    size_t infra = c.infrastructure_count();
    ASSERT_TRUE(c.load_file(path));
    EXPECT_EQ(c.camera_count(), cams + 1);
    EXPECT_EQ(c.infrastructure_count(), infra + 1);

    auto r = c.classify(std::string("11:22:33:44:55:66"));
    EXPECT_EQ(r.manufacturer, std::optional<std::string>("Acme Cams"));
    EXPECT_EQ(r.device_class, std::optional<DeviceClass>(DeviceClass::Camera));

    auto s = c.classify(std::string("44:55:66:00:00:00"));
    EXPECT_EQ(s.manufacturer, std::optional<std::string>("Acme Switches"));
    EXPECT_EQ(s.device_class, std::optional<DeviceClass>(DeviceClass::Infrastructure));

    EXPECT_EQ(c.classify(std::string("A0:CF:5B:00:00:00")).manufacturer, std::optional<std::string>("Relabelled"));
    EXPECT_FALSE(c.classify(std::string("77:88:99:00:00:00")).device_class.has_value());
}

TEST_F(OuiClassifierTest, LoadMissingFileFails) {
    OuiClassifier c;
    EXPECT_FALSE(c.load_file("/nonexistent/cam_scan/oui.csv"));
}

}
