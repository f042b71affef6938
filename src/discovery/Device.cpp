#include "Device.h"
#include <algorithm>
#include <cctype>

namespace cam_scan {

std::string device_class_to_string(DeviceClass c){
    switch(c){
        case DeviceClass::Camera: return "camera";
        case DeviceClass::Infrastructure: return "infrastructure";
        case DeviceClass::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<DeviceClass> device_class_from_string(const std::string& s){
    std::string l = s; std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(l=="camera") return DeviceClass::Camera;
    if(l=="infrastructure") return DeviceClass::Infrastructure;
    if(l=="unknown") return DeviceClass::Unknown;
    return std::nullopt;
}

}
