#pragma once
#include "Config.h"
#include <string>

namespace cam_scan {

class ConfigValidator {
public:
    // Normalizes cfg in place and reports the first problem on stderr.
    bool validate(Config& cfg);

private:
    bool validate_range(int value, int lo, int hi, const std::string& flag_name);
    bool validate_subnets(const Config& cfg);
    bool validate_class_filter(Config& cfg); // lowercases accepted names
};

}
