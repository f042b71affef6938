#include "ConfigValidator.h"
#include "Errors.h"
#include "Logging.h"
#include "../discovery/CidrExpander.h"
#include "../discovery/Device.h"
#include <iostream>

namespace cam_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins (documented behavior)
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(!validate_range(cfg.max_workers, 1, 256, "--workers")) return false;
    if(!validate_range(cfg.ping_timeout_seconds, 1, 60, "--ping-timeout")) return false;
    if(!validate_range(cfg.ping_grace_seconds, 0, 60, "--ping-grace")) return false;
    if(!validate_range(cfg.port_timeout_seconds, 1, 60, "--port-timeout")) return false;
    if(!validate_range(cfg.arp_timeout_seconds, 1, 120, "--arp-timeout")) return false;

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!validate_subnets(cfg)) return false;
    if(!validate_class_filter(cfg)) return false;

    // ndjson lines are never indented
    if(cfg.ndjson) {
        cfg.pretty = false;
    }
    return true;
}

bool ConfigValidator::validate_range(int value, int lo, int hi, const std::string& flag_name) {
    if(value < lo || value > hi) {
        std::cerr << "Invalid " << flag_name << " value: " << value << " (allowed " << lo << ".." << hi << ")\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_subnets(const Config& cfg) {
    for(const auto& s : cfg.subnets) {
        try {
            (void)expand_cidr(s);
        } catch(const InvalidCidr& ex) {
            std::cerr << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::validate_class_filter(Config& cfg) {
    for(auto& c : cfg.class_filter) {
        auto cls = device_class_from_string(c);
        if(!cls) {
            std::cerr << "Invalid --only value: " << c << "\n";
            return false;
        }
        c = device_class_to_string(*cls);
    }
    return true;
}

}
