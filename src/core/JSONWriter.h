#pragma once
#include "Config.h"
#include "../discovery/Device.h"
#include <string>

namespace cam_scan {

class JSONWriter {
public:
    // Object form {meta, summary, devices}, or NDJSON lines when cfg.ndjson is set.
    std::string write(const ScanResult& result, const Config& cfg) const;
};

}
