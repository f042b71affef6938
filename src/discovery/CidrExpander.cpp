#include "CidrExpander.h"
#include "../core/Errors.h"
#include <cctype>

namespace cam_scan {

static std::string trim(const std::string& s){
    size_t a = s.find_first_not_of(" \t\r\n");
    if(a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

static bool all_digits(const std::string& s){
    if(s.empty()) return false;
    for(char c : s) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

bool parse_ipv4(const std::string& s, uint32_t& out){
    uint32_t value = 0; int parts = 0; size_t pos = 0;
    while(true){
        size_t dot = s.find('.', pos);
        std::string part = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if(!all_digits(part) || part.size() > 3) return false;
        int octet = std::stoi(part);
        if(octet > 255) return false;
        value = (value << 8) | static_cast<uint32_t>(octet);
        ++parts;
        if(dot == std::string::npos) break;
        if(parts == 4) return false;
        pos = dot + 1;
    }
    if(parts != 4) return false;
    out = value;
    return true;
}

std::string format_ipv4(uint32_t ip){
    return std::to_string((ip >> 24) & 0xFF) + "." + std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." + std::to_string(ip & 0xFF);
}

std::vector<std::string> expand_cidr(const std::string& cidr){
    std::string text = trim(cidr);
    auto slash = text.find('/');
    std::string addr_part = slash == std::string::npos ? text : text.substr(0, slash);

    uint32_t base = 0;
    if(!parse_ipv4(addr_part, base)) throw InvalidCidr(cidr, "address is not a dotted quad");
    if(slash == std::string::npos) return {addr_part};

    std::string prefix_part = trim(text.substr(slash + 1));
    if(!all_digits(prefix_part)) throw InvalidCidr(cidr, "prefix is not an integer");
    size_t nz = prefix_part.find_first_not_of('0');
    std::string digits = nz == std::string::npos ? "0" : prefix_part.substr(nz);
    if(digits.size() > 2) throw InvalidCidr(cidr, "prefix out of range [0,32]");
    int prefix = std::stoi(digits);
    if(prefix > 32) throw InvalidCidr(cidr, "prefix out of range [0,32]");
    if(prefix < kMinScanPrefix) prefix = kMinScanPrefix;

    uint64_t block = uint64_t(1) << (32 - prefix);
    uint32_t mask = prefix == 0 ? 0u : static_cast<uint32_t>(0xFFFFFFFFull << (32 - prefix));
    uint32_t network = base & mask;

    std::vector<std::string> out;
    if(block <= 2) return out; // /31 and /32 have no usable host range
    out.reserve(static_cast<size_t>(block - 2));
    for(uint64_t i = 1; i < block - 1; ++i) out.push_back(format_ipv4(network + static_cast<uint32_t>(i)));
    return out;
}

}
