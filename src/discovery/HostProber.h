#pragma once
#include "Device.h"
#include "ArpSnapshot.h"
#include "OuiClassifier.h"
#include "NetworkEnvironment.h"
#include <optional>
#include <string>
#include <cstdint>

namespace cam_scan {

constexpr uint16_t kRtspPort = 554;
constexpr uint16_t kHttpPort = 80;
constexpr uint16_t kHttpsPort = 443;
constexpr uint16_t kHttpAltPort = 8080;

struct ProbeTimeouts {
    int ping_seconds = 1;
    int port_seconds = 1;
};

// Probes one address: liveness, MAC lookup, OUI classification, then the four camera-relevant
// TCP ports, in that order. Hosts that fail liveness yield no record. Never throws for
// per-host failures.
class HostProber {
public:
    HostProber(NetworkEnvironment& env, const OuiClassifier& classifier, ProbeTimeouts timeouts = {})
        : env_(env), classifier_(classifier), timeouts_(timeouts) {}

    std::optional<DeviceRecord> probe(const std::string& address, const ArpSnapshot& arp) const;

    // OUI class wins; otherwise an open RTSP port means camera; everything else is unknown.
    static DeviceClass resolve_class(const Classification& oui, const OpenPorts& ports);
private:
    bool port_open(const std::string& address, uint16_t port) const;

    NetworkEnvironment& env_;
    const OuiClassifier& classifier_;
    ProbeTimeouts timeouts_;
};

}
