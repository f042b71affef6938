#pragma once
#include "Device.h"
#include "HostProber.h"
#include "ScanSession.h"
#include "NetworkEnvironment.h"
#include "OuiClassifier.h"
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cam_scan {

struct Config;

constexpr size_t kDefaultMaxWorkers = 50;

struct ScanOptions {
    size_t max_workers = kDefaultMaxWorkers;
    ProbeTimeouts timeouts;

    static ScanOptions from_config(const Config& cfg);
};

// Runs discovery passes: expand subnets, snapshot the ARP table once, probe every address on
// a bounded worker pool and collect records as they complete. At most one session is active
// per orchestrator.
class ScanOrchestrator {
public:
    ScanOrchestrator(NetworkEnvironment& env, const OuiClassifier& classifier, ScanOptions options = {});
    ~ScanOrchestrator();
    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    // Blocking pass. An empty subnet list means the locally detected subnets.
    // Throws InvalidCidr, ScanInProgress or PoolSubmissionFailure.
    ScanResult run_scan(const std::vector<std::string>& subnets);

    // Same pass on a dedicated thread. Subnets are validated before this returns.
    std::shared_ptr<ScanSession> start_scan(const std::vector<std::string>& subnets);

    std::shared_ptr<ScanSession> active_session() const;

    std::vector<std::string> resolve_subnets(const std::vector<std::string>& requested);
    ArpSnapshot take_arp_snapshot();

    const ScanOptions& options() const { return options_; }
private:
    std::shared_ptr<ScanSession> acquire_session(std::vector<std::string> subnets);
    void release_session(const std::shared_ptr<ScanSession>& session);
    ScanResult execute(ScanSession& session, const std::vector<std::string>& addresses);

    NetworkEnvironment& env_;
    const OuiClassifier& classifier_;
    ScanOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<ScanSession> active_;

    std::mutex worker_mutex_;
    std::thread worker_;
};

}
