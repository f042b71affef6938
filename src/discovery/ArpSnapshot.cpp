#include "ArpSnapshot.h"
#include "MacAddress.h"
#include <sstream>
#include <cctype>

namespace cam_scan {

static bool is_ip_token(const std::string& tok){
    int dots = 0; size_t run = 0;
    for(char c : tok){
        if(c == '.'){ if(run == 0) return false; ++dots; run = 0; continue; }
        if(!std::isdigit(static_cast<unsigned char>(c))) return false;
        ++run;
    }
    return dots == 3 && run > 0;
}

std::vector<ArpEntry> parse_arp_dump(const std::string& text){
    std::vector<ArpEntry> out;
    std::istringstream lines(text);
    std::string line;
    while(std::getline(lines, line)){
        std::istringstream ss(line);
        std::string tok, ip, mac;
        while(ss >> tok){
            if(is_ip_token(tok)) ip = tok;
            else if(is_mac_token(tok)) mac = normalize_mac(tok);
        }
        if(ip.empty() || mac.empty()) continue;
        if(mac == kBroadcastMac || mac == kIncompleteMac) continue;
        out.push_back({ip, mac});
    }
    return out;
}

ArpSnapshot::ArpSnapshot(const std::vector<ArpEntry>& entries){
    for(const auto& e : entries) map_[e.address] = normalize_mac(e.mac);
}

std::optional<std::string> ArpSnapshot::lookup(const std::string& address) const {
    auto it = map_.find(address);
    if(it == map_.end()) return std::nullopt;
    return it->second;
}

}
