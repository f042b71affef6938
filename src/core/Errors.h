#pragma once
#include <stdexcept>
#include <string>

namespace cam_scan {

// Malformed subnet specification; always surfaced to the caller.
class InvalidCidr : public std::invalid_argument {
public:
    InvalidCidr(const std::string& cidr, const std::string& reason)
        : std::invalid_argument("invalid CIDR '" + cidr + "': " + reason), cidr_(cidr) {}
    const std::string& cidr() const { return cidr_; }
private:
    std::string cidr_;
};

// Not a single probe worker could be started.
class PoolSubmissionFailure : public std::runtime_error {
public:
    explicit PoolSubmissionFailure(const std::string& detail)
        : std::runtime_error("unable to start probe workers: " + detail) {}
};

class ScanInProgress : public std::runtime_error {
public:
    ScanInProgress() : std::runtime_error("a scan is already in progress") {}
};

}
