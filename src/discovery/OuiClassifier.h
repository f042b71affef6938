#pragma once
#include "Device.h"
#include "OuiTables.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace cam_scan {

struct Classification {
    std::optional<std::string> manufacturer;
    std::optional<DeviceClass> device_class;
};

// MAC -> (manufacturer, class) lookup over two tables. The camera table is consulted first,
// so an OUI listed in both always classifies as a camera.
class OuiClassifier {
public:
    OuiClassifier(); // built-in tables
    OuiClassifier(const std::vector<OuiEntry>& camera, const std::vector<OuiEntry>& infrastructure);

    // Adds or overrides one entry. cls must be Camera or Infrastructure.
    void add(DeviceClass cls, const std::string& oui, const std::string& manufacturer);

    // Extension file: "camera|infrastructure,XX:XX:XX,Manufacturer" per line, '#' comments.
    // Malformed lines are logged and skipped; returns false if the file cannot be opened.
    bool load_file(const std::string& path);

    Classification classify(const std::optional<std::string>& mac) const;

    size_t camera_count() const { return camera_.size(); }
    size_t infrastructure_count() const { return infrastructure_.size(); }
    // Keys that appeared more than once within the same table (last write won).
    const std::vector<std::string>& duplicate_ouis() const { return duplicates_; }
private:
    void insert(std::unordered_map<std::string,std::string>& table, const char* table_name,
                const std::string& oui, const std::string& manufacturer);

    std::unordered_map<std::string,std::string> camera_;
    std::unordered_map<std::string,std::string> infrastructure_;
    std::vector<std::string> duplicates_;
};

}
