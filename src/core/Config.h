#pragma once
#include <string>
#include <vector>

namespace cam_scan {

struct Config {
    std::vector<std::string> subnets; // empty = detect from local interfaces
    int max_workers = 50; // simultaneous in-flight host probes
    int ping_timeout_seconds = 1;
    int ping_grace_seconds = 2; // extra wall time granted to the ping process
    int port_timeout_seconds = 1;
    int arp_timeout_seconds = 10;
    std::string oui_file; // extra OUI entries appended to the built-in tables
    std::vector<std::string> class_filter; // camera|infrastructure|unknown; empty = all
    std::string output_file;
    bool pretty = false;
    bool compact = false; // wins over pretty
    bool ndjson = false;
    bool canonical = false; // sort devices by address instead of completion order
    std::string log_level = "info";
    bool drop_priv = false;
    bool no_hostname_meta = false;
    bool fail_on_empty = false; // exit 1 when no device was found
};

}
