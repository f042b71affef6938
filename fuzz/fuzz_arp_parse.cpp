#include "discovery/ArpSnapshot.h"
#include "discovery/MacAddress.h"
#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string text(reinterpret_cast<const char*>(data), size);
    auto entries = cam_scan::parse_arp_dump(text);
    for (const auto& e : entries) {
        // every accepted MAC must be normalized and never broadcast
        if (e.mac == cam_scan::kBroadcastMac || e.mac != cam_scan::normalize_mac(e.mac)) std::abort();
    }
    cam_scan::ArpSnapshot snap(entries);
    (void)snap.size();
    return 0;
}
