// Linux privilege helpers (best-effort; compile-time gated)
#pragma once
#include <string>

namespace cam_scan {
// Clears every capability of the process, keeping CAP_NET_RAW when keep_net_raw is set.
// Returns false when the drop could not be applied or libcap is not compiled in.
bool drop_capabilities(bool keep_net_raw);
void log_capabilities(const std::string& context);
bool is_privilege_available();
}
