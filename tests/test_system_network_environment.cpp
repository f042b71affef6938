#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/discovery/SystemNetworkEnvironment.h"
#include "../src/discovery/CidrExpander.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cam_scan {

class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ >= 0 && bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && listen(fd_, 4) == 0) {
            socklen_t len = sizeof(addr);
            if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) port_ = ntohs(addr.sin_port);
        }
    }
    ~LoopbackListener() { close_now(); }
    void close_now() { if (fd_ >= 0) { close(fd_); fd_ = -1; } }
    uint16_t port() const { return port_; }
private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

TEST(SystemNetworkEnvironmentTest, TcpProbeOpenAndClosedPort) {
    SystemNetworkEnvironment env;
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0);
    EXPECT_TRUE(env.probe_tcp_port("127.0.0.1", listener.port(), 1));

    uint16_t port = listener.port();
    listener.close_now();
    EXPECT_FALSE(env.probe_tcp_port("127.0.0.1", port, 1));
}

TEST(SystemNetworkEnvironmentTest, MalformedAddressesRejected) {
    SystemNetworkEnvironment env;
    EXPECT_FALSE(env.probe_tcp_port("not-an-ip", 80, 1));
    EXPECT_FALSE(env.ping_host("not-an-ip", 1));
    EXPECT_FALSE(env.ping_host("-c100", 1));
}

TEST(SystemNetworkEnvironmentTest, DetectedSubnetsAreSlash24) {
    SystemNetworkEnvironment env;
    auto subnets = env.detect_local_subnets();
    ASSERT_FALSE(subnets.empty());
    for (const auto& s : subnets) {
        EXPECT_THAT(s, ::testing::EndsWith(".0/24"));
        EXPECT_EQ(expand_cidr(s).size(), 254u);
    }
}

TEST(SystemNetworkEnvironmentTest, ArpTableReadIsBestEffort) {
    SystemNetworkEnvironment env(2, 2);
    std::vector<ArpEntry> entries;
    EXPECT_NO_THROW(entries = env.read_arp_table());
    for (const auto& e : entries) {
        uint32_t ip = 0;
        EXPECT_TRUE(parse_ipv4(e.address, ip));
        EXPECT_NE(e.mac, "FF:FF:FF:FF:FF:FF");
    }
}

}
