#include "OuiClassifier.h"
#include "MacAddress.h"
#include "../core/Logging.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cam_scan {

OuiClassifier::OuiClassifier() : OuiClassifier(camera_oui_table(), infrastructure_oui_table()) {}

OuiClassifier::OuiClassifier(const std::vector<OuiEntry>& camera, const std::vector<OuiEntry>& infrastructure){
    for(const auto& e : camera) insert(camera_, "camera", normalize_mac(e.oui), e.manufacturer);
    for(const auto& e : infrastructure) insert(infrastructure_, "infrastructure", normalize_mac(e.oui), e.manufacturer);
}

void OuiClassifier::insert(std::unordered_map<std::string,std::string>& table, const char* table_name,
                           const std::string& oui, const std::string& manufacturer){
    auto it = table.find(oui);
    if(it != table.end()){
        Logger::instance().warn(std::string("OUI ") + oui + " listed twice in " + table_name + " table ("
                                + it->second + ", " + manufacturer + "); using " + manufacturer);
        duplicates_.push_back(oui);
        it->second = manufacturer;
        return;
    }
    table.emplace(oui, manufacturer);
}

void OuiClassifier::add(DeviceClass cls, const std::string& oui, const std::string& manufacturer){
    std::string key = normalize_mac(oui);
    if(!is_oui(key)) throw std::invalid_argument("malformed OUI: " + oui);
    switch(cls){
        case DeviceClass::Camera: insert(camera_, "camera", key, manufacturer); break;
        case DeviceClass::Infrastructure: insert(infrastructure_, "infrastructure", key, manufacturer); break;
        case DeviceClass::Unknown: throw std::invalid_argument("OUI entries must be camera or infrastructure");
    }
}

bool OuiClassifier::load_file(const std::string& path){
    std::ifstream in(path);
    if(!in){
        Logger::instance().error("Failed to open OUI file: " + path);
        return false;
    }
    std::string line; size_t lineno = 0, loaded = 0;
    while(std::getline(in, line)){
        ++lineno;
        size_t start = line.find_first_not_of(" \t");
        if(start == std::string::npos) continue;
        line = line.substr(start);
        if(line[0] == '#') continue;
        if(!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream ss(line); std::string cls_s, oui, manufacturer;
        std::getline(ss, cls_s, ','); std::getline(ss, oui, ','); std::getline(ss, manufacturer);
        auto trim = [](std::string& s){
            size_t a = s.find_first_not_of(" \t"); size_t b = s.find_last_not_of(" \t");
            s = (a == std::string::npos) ? std::string() : s.substr(a, b - a + 1);
        };
        trim(cls_s); trim(oui); trim(manufacturer);
        auto cls = device_class_from_string(cls_s);
        if(!cls || *cls == DeviceClass::Unknown || !is_oui(oui) || manufacturer.empty()){
            Logger::instance().warn(path + ":" + std::to_string(lineno) + ": malformed OUI entry skipped");
            continue;
        }
        add(*cls, oui, manufacturer);
        ++loaded;
    }
    Logger::instance().debug("Loaded " + std::to_string(loaded) + " OUI entries from " + path);
    return true;
}

Classification OuiClassifier::classify(const std::optional<std::string>& mac) const {
    Classification c;
    if(!mac) return c;
    std::string oui = oui_of(*mac);
    if(oui.empty()) return c;
    if(auto it = camera_.find(oui); it != camera_.end()){
        c.manufacturer = it->second; c.device_class = DeviceClass::Camera;
        return c;
    }
    if(auto it = infrastructure_.find(oui); it != infrastructure_.end()){
        c.manufacturer = it->second; c.device_class = DeviceClass::Infrastructure;
    }
    return c;
}

}
