#include "HostProber.h"
#include "../core/Logging.h"
#include <exception>

namespace cam_scan {

DeviceClass HostProber::resolve_class(const Classification& oui, const OpenPorts& ports){
    if(oui.device_class) return *oui.device_class;
    if(ports.rtsp) return DeviceClass::Camera;
    return DeviceClass::Unknown; // web ports alone never imply infrastructure
}

bool HostProber::port_open(const std::string& address, uint16_t port) const {
    try {
        return env_.probe_tcp_port(address, port, timeouts_.port_seconds);
    } catch(const std::exception& ex){
        Logger::instance().debug(address + ":" + std::to_string(port) + " probe failed: " + ex.what());
        return false;
    }
}

std::optional<DeviceRecord> HostProber::probe(const std::string& address, const ArpSnapshot& arp) const {
    bool alive = false;
    try {
        alive = env_.ping_host(address, timeouts_.ping_seconds);
    } catch(const std::exception& ex){
        Logger::instance().debug(address + ": liveness check failed: " + ex.what());
    }
    if(!alive){
        Logger::instance().debug(address + ": no reply");
        return std::nullopt;
    }

    DeviceRecord rec;
    rec.address = address;
    rec.mac = arp.lookup(address);
    Classification oui = classifier_.classify(rec.mac);
    rec.manufacturer = oui.manufacturer;

    rec.open_ports.rtsp = port_open(address, kRtspPort);
    rec.open_ports.http = port_open(address, kHttpPort);
    rec.open_ports.https = port_open(address, kHttpsPort);
    rec.open_ports.http_alt = port_open(address, kHttpAltPort);

    rec.device_class = resolve_class(oui, rec.open_ports);
    rec.discovered_at = std::chrono::system_clock::now();
    return rec;
}

}
