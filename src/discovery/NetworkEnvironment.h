#pragma once
#include "ArpSnapshot.h"
#include <string>
#include <vector>
#include <cstdint>

namespace cam_scan {

constexpr const char* kDefaultSubnet = "192.168.1.0/24";

// OS-facing collaborators of the discovery engine. ping_host and probe_tcp_port are called
// concurrently from probe workers and must be thread-safe.
class NetworkEnvironment {
public:
    virtual ~NetworkEnvironment() = default;
    // Best-effort; never empty (falls back to kDefaultSubnet).
    virtual std::vector<std::string> detect_local_subnets() = 0;
    virtual bool ping_host(const std::string& address, int timeout_seconds) = 0;
    virtual bool probe_tcp_port(const std::string& address, uint16_t port, int timeout_seconds) = 0;
    // Best-effort; empty when no neighbour table source is available.
    virtual std::vector<ArpEntry> read_arp_table() = 0;
};

}
