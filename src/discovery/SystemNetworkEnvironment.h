#pragma once
#include "NetworkEnvironment.h"

namespace cam_scan {

// Linux implementation: getifaddrs, the system ping binary, non-blocking connect and the
// kernel neighbour table.
class SystemNetworkEnvironment : public NetworkEnvironment {
public:
    explicit SystemNetworkEnvironment(int ping_grace_seconds = 2, int arp_timeout_seconds = 10)
        : ping_grace_seconds_(ping_grace_seconds), arp_timeout_seconds_(arp_timeout_seconds) {}

    std::vector<std::string> detect_local_subnets() override;
    bool ping_host(const std::string& address, int timeout_seconds) override;
    bool probe_tcp_port(const std::string& address, uint16_t port, int timeout_seconds) override;
    std::vector<ArpEntry> read_arp_table() override;
private:
    int ping_grace_seconds_;
    int arp_timeout_seconds_;
};

}
