#pragma once
#include <string>
#include <chrono>

namespace cam_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// ISO-8601 UTC, second precision. Epoch zero yields an empty string.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
