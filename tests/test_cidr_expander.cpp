#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/discovery/CidrExpander.h"
#include "../src/core/Errors.h"
#include <string>
#include <vector>

namespace cam_scan {

TEST(CidrExpanderTest, Slash24YieldsHostRange) {
    auto hosts = expand_cidr("192.168.1.0/24");
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
    EXPECT_THAT(hosts, ::testing::Not(::testing::Contains("192.168.1.0")));
    EXPECT_THAT(hosts, ::testing::Not(::testing::Contains("192.168.1.255")));
}

TEST(CidrExpanderTest, AscendingOrder) {
    auto hosts = expand_cidr("10.1.2.0/24");
    for (size_t i = 1; i < hosts.size(); ++i) {
        uint32_t a = 0, b = 0;
        ASSERT_TRUE(parse_ipv4(hosts[i - 1], a));
        ASSERT_TRUE(parse_ipv4(hosts[i], b));
        EXPECT_LT(a, b);
    }
}

TEST(CidrExpanderTest, HostBitsInBaseAreMasked) {
    EXPECT_EQ(expand_cidr("192.168.1.77/24"), expand_cidr("192.168.1.0/24"));
}

TEST(CidrExpanderTest, WidePrefixClampedAroundLiteralBase) {
    auto clamped = expand_cidr("10.0.0.5/16");
    EXPECT_EQ(clamped, expand_cidr("10.0.0.0/24"));
    ASSERT_EQ(clamped.size(), 254u);
    EXPECT_EQ(clamped.front(), "10.0.0.1");

    // the /24 around the literal base, not the first /24 of the /16
    auto other = expand_cidr("10.0.7.9/8");
    ASSERT_EQ(other.size(), 254u);
    EXPECT_EQ(other.front(), "10.0.7.1");
    EXPECT_EQ(other.back(), "10.0.7.254");
}

TEST(CidrExpanderTest, SlashZeroClampedToo) {
    auto hosts = expand_cidr("172.16.4.1/0");
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "172.16.4.1");
}

TEST(CidrExpanderTest, NarrowPrefixes) {
    auto hosts = expand_cidr("192.168.1.0/30");
    EXPECT_EQ(hosts, (std::vector<std::string>{"192.168.1.1", "192.168.1.2"}));
    EXPECT_EQ(expand_cidr("192.168.1.64/26").size(), 62u);
    EXPECT_TRUE(expand_cidr("192.168.1.0/31").empty());
    EXPECT_TRUE(expand_cidr("192.168.1.7/32").empty());
}

TEST(CidrExpanderTest, ZeroPaddedAndSpacedPrefixes) {
    auto reference = expand_cidr("10.0.0.0/24");
    EXPECT_EQ(expand_cidr("10.0.0.0/024"), reference);
    EXPECT_EQ(expand_cidr("10.0.0.0/ 24"), reference);
    EXPECT_EQ(expand_cidr("10.0.0.0/0000000000024"), reference);
    EXPECT_EQ(expand_cidr("10.0.0.0/030").size(), 2u);
    EXPECT_EQ(expand_cidr("10.0.0.5/00").size(), 254u);
    EXPECT_THROW(expand_cidr("10.0.0.0/033"), InvalidCidr);
    EXPECT_THROW(expand_cidr("10.0.0.0/100"), InvalidCidr);
    EXPECT_THROW(expand_cidr("10.0.0.0/99999999999999999999"), InvalidCidr);
    EXPECT_THROW(expand_cidr("10.0.0.0/2 4"), InvalidCidr);
}

TEST(CidrExpanderTest, BareAddressYieldsItself) {
    EXPECT_EQ(expand_cidr("203.0.113.7"), (std::vector<std::string>{"203.0.113.7"}));
    EXPECT_EQ(expand_cidr("  203.0.113.7 "), (std::vector<std::string>{"203.0.113.7"}));
}

TEST(CidrExpanderTest, MalformedInputThrows) {
    EXPECT_THROW(expand_cidr(""), InvalidCidr);
    EXPECT_THROW(expand_cidr("not-an-ip"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1/24"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1.256/24"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1.0/33"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1.0/abc"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1.0/"), InvalidCidr);
    EXPECT_THROW(expand_cidr("192.168.1.0/-1"), InvalidCidr);
    EXPECT_THROW(expand_cidr("1.2.3.4.5"), InvalidCidr);
    EXPECT_THROW(expand_cidr("hostname.local"), InvalidCidr);
}

TEST(CidrExpanderTest, ErrorCarriesInput) {
    try {
        expand_cidr("10.0.0.0/40");
        FAIL() << "expected InvalidCidr";
    } catch (const InvalidCidr& ex) {
        EXPECT_EQ(ex.cidr(), "10.0.0.0/40");
        EXPECT_THAT(std::string(ex.what()), ::testing::HasSubstr("10.0.0.0/40"));
    }
}

TEST(CidrExpanderTest, ParseAndFormatIpv4) {
    uint32_t ip = 0;
    ASSERT_TRUE(parse_ipv4("192.168.1.10", ip));
    EXPECT_EQ(ip, 0xC0A8010Au);
    EXPECT_EQ(format_ipv4(ip), "192.168.1.10");
    EXPECT_FALSE(parse_ipv4("192.168.1.", ip));
    EXPECT_FALSE(parse_ipv4(".168.1.1", ip));
    EXPECT_FALSE(parse_ipv4("1..1.1", ip));
    EXPECT_FALSE(parse_ipv4("1.2.3.0004", ip));
    EXPECT_FALSE(parse_ipv4("1.2.3.+4", ip));
}

}
