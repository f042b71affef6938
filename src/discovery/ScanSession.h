#pragma once
#include "Device.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace cam_scan {

class ScanOrchestrator;

// State of one discovery pass. Created and driven by ScanOrchestrator; callers observe
// progress, read the records collected so far, request cancellation and wait for the result.
class ScanSession {
public:
    explicit ScanSession(std::vector<std::string> subnets);

    const std::vector<std::string>& subnets() const { return subnets_; }

    // Stops submission of further addresses; in-flight probes run to completion.
    void cancel(){ cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

    bool in_progress() const { return in_progress_.load(); }
    size_t addresses_total() const { return addresses_total_.load(); }
    size_t addresses_probed() const { return addresses_probed_.load(); }

    std::vector<DeviceRecord> devices() const;
    size_t device_count() const;

    // Blocks until the pass ends. Rethrows a structural failure of the pass.
    ScanResult wait();
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class ScanOrchestrator;
    void begin(size_t total);
    void record(DeviceRecord rec);
    void mark_probed(){ addresses_probed_.fetch_add(1); }
    void finish(ScanResult result);
    void fail(std::exception_ptr error);

    std::vector<std::string> subnets_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> in_progress_{true}; // until finish() or fail()
    std::atomic<size_t> addresses_total_{0};
    std::atomic<size_t> addresses_probed_{0};

    mutable std::mutex mutex_;
    std::vector<DeviceRecord> devices_;

    std::promise<ScanResult> promise_;
    std::shared_future<ScanResult> result_;
};

}
