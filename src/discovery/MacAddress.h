#pragma once
#include <string>

namespace cam_scan {

constexpr const char* kBroadcastMac = "FF:FF:FF:FF:FF:FF";
constexpr const char* kIncompleteMac = "00:00:00:00:00:00";

// Six hex pairs separated uniformly by ':' or by '-'.
bool is_mac_token(const std::string& token);
// Uppercase, hyphens to colons. Input is not validated.
std::string normalize_mac(const std::string& mac);
// "XX:XX:XX" of a MAC (normalized), or empty when too short.
std::string oui_of(const std::string& mac);
bool is_oui(const std::string& s);

}
