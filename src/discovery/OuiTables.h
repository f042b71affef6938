#pragma once
#include <string>
#include <vector>

namespace cam_scan {

struct OuiEntry {
    std::string oui;          // "XX:XX:XX", uppercase
    std::string manufacturer;
};

// Built-in vendor blocks, in declaration order (later duplicates override earlier ones).
const std::vector<OuiEntry>& camera_oui_table();
const std::vector<OuiEntry>& infrastructure_oui_table();

}
