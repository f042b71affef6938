#include "MacAddress.h"
#include <cctype>

namespace cam_scan {

static bool hex_pairs(const std::string& s, size_t pairs){
    if(s.size() != pairs*3 - 1) return false;
    char sep = pairs > 1 ? s[2] : ':';
    if(sep != ':' && sep != '-') return false;
    for(size_t i=0;i<s.size();++i){
        if(i % 3 == 2){ if(s[i] != sep) return false; }
        else if(!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_mac_token(const std::string& token){ return hex_pairs(token, 6); }

bool is_oui(const std::string& s){ return hex_pairs(s, 3); }

std::string normalize_mac(const std::string& mac){
    std::string out = mac;
    for(auto& c : out){ if(c=='-') c=':'; else c = static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
    return out;
}

std::string oui_of(const std::string& mac){
    if(mac.size() < 8) return "";
    return normalize_mac(mac.substr(0, 8));
}

}
