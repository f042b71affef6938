#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace cam_scan {

enum class DeviceClass { Camera, Infrastructure, Unknown };

std::string device_class_to_string(DeviceClass c);
std::optional<DeviceClass> device_class_from_string(const std::string& s);

struct OpenPorts {
    bool rtsp = false;     // 554
    bool http = false;     // 80
    bool https = false;    // 443
    bool http_alt = false; // 8080

    bool any_web() const { return http || https || http_alt; }
};

struct DeviceRecord {
    std::string address;
    std::optional<std::string> mac;
    std::optional<std::string> manufacturer;
    DeviceClass device_class = DeviceClass::Unknown;
    OpenPorts open_ports;
    std::chrono::system_clock::time_point discovered_at;
};

struct ScanResult {
    std::vector<std::string> subnets;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    size_t addresses_total = 0;
    size_t addresses_probed = 0;
    bool cancelled = false;
    std::vector<DeviceRecord> devices; // completion order
};

}
