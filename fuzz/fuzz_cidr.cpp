#include "discovery/CidrExpander.h"
#include "core/Errors.h"
#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string cidr(reinterpret_cast<const char*>(data), size);
    try {
        auto hosts = cam_scan::expand_cidr(cidr);
        if (hosts.size() > 254) std::abort();
    } catch (const cam_scan::InvalidCidr&) {
    }
    return 0;
}
