#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace cam_scan {

// Narrowest prefix ever expanded in one pass; wider requests are clamped to it.
constexpr int kMinScanPrefix = 24;

// Expands "a.b.c.d/n" into host addresses (network and broadcast excluded), or returns
// {address} when no prefix is given. A prefix below /24 is clamped to /24 around the literal
// base address, so "10.0.0.5/16" expands to 10.0.0.1 .. 10.0.0.254.
// Throws InvalidCidr on malformed input.
std::vector<std::string> expand_cidr(const std::string& cidr);

// Strict dotted-quad parse (four decimal components, each 0..255).
bool parse_ipv4(const std::string& s, uint32_t& out);
std::string format_ipv4(uint32_t ip);

}
