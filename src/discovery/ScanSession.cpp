#include "ScanSession.h"

namespace cam_scan {

ScanSession::ScanSession(std::vector<std::string> subnets)
    : subnets_(std::move(subnets)), result_(promise_.get_future().share()) {}

void ScanSession::begin(size_t total){
    addresses_total_.store(total);
}

void ScanSession::record(DeviceRecord rec){
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.push_back(std::move(rec));
}

std::vector<DeviceRecord> ScanSession::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

size_t ScanSession::device_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void ScanSession::finish(ScanResult result){
    in_progress_.store(false);
    promise_.set_value(std::move(result));
}

void ScanSession::fail(std::exception_ptr error){
    in_progress_.store(false);
    promise_.set_exception(error);
}

ScanResult ScanSession::wait(){
    return result_.get();
}

bool ScanSession::wait_for(std::chrono::milliseconds timeout) const {
    return result_.wait_for(timeout) == std::future_status::ready;
}

}
