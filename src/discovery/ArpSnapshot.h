#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace cam_scan {

struct ArpEntry {
    std::string address;
    std::string mac; // normalized
};

// Extracts (ip, mac) pairs from free-form neighbour table text (`arp -n`, `arp -a`,
// `ip neigh`, /proc/net/arp). A line counts only when it holds both an all-numeric dotted
// quad and a uniformly separated MAC token; broadcast and all-zero MACs are dropped.
std::vector<ArpEntry> parse_arp_dump(const std::string& text);

// Immutable IP -> MAC view captured once per scan. Safe for concurrent reads.
class ArpSnapshot {
public:
    ArpSnapshot() = default;
    explicit ArpSnapshot(const std::vector<ArpEntry>& entries); // later entries win

    std::optional<std::string> lookup(const std::string& address) const;
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }
private:
    std::unordered_map<std::string,std::string> map_;
};

}
