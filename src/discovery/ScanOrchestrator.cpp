#include "ScanOrchestrator.h"
#include "CidrExpander.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <algorithm>
#include <atomic>
#include <system_error>

namespace cam_scan {

ScanOptions ScanOptions::from_config(const Config& cfg){
    ScanOptions o;
    o.max_workers = static_cast<size_t>(std::max(1, cfg.max_workers));
    o.timeouts.ping_seconds = cfg.ping_timeout_seconds;
    o.timeouts.port_seconds = cfg.port_timeout_seconds;
    return o;
}

static std::vector<std::string> expand_all(const std::vector<std::string>& subnets){
    std::vector<std::string> all;
    for(const auto& s : subnets){
        auto ips = expand_cidr(s);
        all.insert(all.end(), ips.begin(), ips.end()); // no de-duplication across subnets
    }
    return all;
}

static std::string join_csv(const std::vector<std::string>& v){
    std::string out;
    for(size_t i=0;i<v.size();++i){ if(i) out += ", "; out += v[i]; }
    return out;
}

ScanOrchestrator::ScanOrchestrator(NetworkEnvironment& env, const OuiClassifier& classifier, ScanOptions options)
    : env_(env), classifier_(classifier), options_(options) {
    if(options_.max_workers == 0) options_.max_workers = 1;
}

ScanOrchestrator::~ScanOrchestrator(){
    if(auto s = active_session()) s->cancel();
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if(worker_.joinable()) worker_.join();
}

std::shared_ptr<ScanSession> ScanOrchestrator::active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::shared_ptr<ScanSession> ScanOrchestrator::acquire_session(std::vector<std::string> subnets){
    std::lock_guard<std::mutex> lock(mutex_);
    if(active_) throw ScanInProgress();
    active_ = std::make_shared<ScanSession>(std::move(subnets));
    return active_;
}

void ScanOrchestrator::release_session(const std::shared_ptr<ScanSession>& session){
    std::lock_guard<std::mutex> lock(mutex_);
    if(active_ == session) active_.reset();
}

std::vector<std::string> ScanOrchestrator::resolve_subnets(const std::vector<std::string>& requested){
    if(!requested.empty()) return requested;
    std::vector<std::string> detected;
    try {
        detected = env_.detect_local_subnets();
    } catch(const std::exception& ex){
        Logger::instance().warn(std::string("Subnet detection unavailable: ") + ex.what());
    }
    if(detected.empty()) detected.push_back(kDefaultSubnet);
    return detected;
}

ArpSnapshot ScanOrchestrator::take_arp_snapshot(){
    std::vector<ArpEntry> entries;
    try {
        entries = env_.read_arp_table();
    } catch(const std::exception& ex){
        Logger::instance().warn(std::string("ARP table unavailable: ") + ex.what());
        return ArpSnapshot{};
    }
    ArpSnapshot snap(entries);
    Logger::instance().debug("ARP snapshot: " + std::to_string(snap.size()) + " entries");
    return snap;
}

ScanResult ScanOrchestrator::run_scan(const std::vector<std::string>& subnets){
    auto resolved = resolve_subnets(subnets);
    auto addresses = expand_all(resolved);
    auto session = acquire_session(resolved);
    try {
        ScanResult result = execute(*session, addresses);
        release_session(session);
        session->finish(result);
        return result;
    } catch(const std::exception&){
        release_session(session);
        session->fail(std::current_exception());
        throw;
    }
}

std::shared_ptr<ScanSession> ScanOrchestrator::start_scan(const std::vector<std::string>& subnets){
    auto resolved = resolve_subnets(subnets);
    auto addresses = expand_all(resolved);
    auto session = acquire_session(resolved);

    std::lock_guard<std::mutex> lock(worker_mutex_);
    if(worker_.joinable()) worker_.join(); // previous pass already released its session
    try {
        worker_ = std::thread([this, session, addresses = std::move(addresses)]{
            try {
                ScanResult result = execute(*session, addresses);
                release_session(session);
                session->finish(std::move(result));
            } catch(const std::exception& ex){
                Logger::instance().error(std::string("Scan failed: ") + ex.what());
                release_session(session);
                session->fail(std::current_exception());
            }
        });
    } catch(const std::system_error& ex){
        release_session(session);
        throw PoolSubmissionFailure(ex.what());
    }
    return session;
}

ScanResult ScanOrchestrator::execute(ScanSession& session, const std::vector<std::string>& addresses){
    ScanResult result;
    result.subnets = session.subnets();
    result.started_at = std::chrono::system_clock::now();
    result.addresses_total = addresses.size();
    Logger::instance().info("Scanning subnet(s): " + join_csv(result.subnets));
    Logger::instance().info("Scanning " + std::to_string(addresses.size()) + " IP addresses...");

    // Taken once; workers only read it.
    const ArpSnapshot arp = take_arp_snapshot();
    session.begin(addresses.size());

    HostProber prober(env_, classifier_, options_.timeouts);
    std::atomic<size_t> next{0};
    auto work = [&]{
        while(!session.cancel_requested()){
            size_t i = next.fetch_add(1);
            if(i >= addresses.size()) break;
            const std::string& addr = addresses[i];
            std::optional<DeviceRecord> rec;
            try {
                rec = prober.probe(addr, arp);
            } catch(const std::exception& ex){
                Logger::instance().error(addr + ": probe aborted: " + ex.what());
            }
            session.mark_probed();
            if(!rec) continue;
            Logger::instance().info("Found: " + rec->address + " - " + rec->manufacturer.value_or("Unknown")
                                    + " (" + device_class_to_string(rec->device_class) + ")");
            session.record(std::move(*rec));
        }
    };

    size_t pool = std::min(options_.max_workers, addresses.size());
    std::vector<std::thread> workers;
    workers.reserve(pool);
    for(size_t k=0; k<pool; ++k){
        try {
            workers.emplace_back(work);
        } catch(const std::system_error& ex){
            if(workers.empty()) throw PoolSubmissionFailure(ex.what());
            Logger::instance().warn("Started " + std::to_string(workers.size()) + " of " + std::to_string(pool)
                                    + " probe workers: " + ex.what());
            break;
        }
    }
    for(auto& t : workers) t.join();

    result.finished_at = std::chrono::system_clock::now();
    result.addresses_probed = session.addresses_probed();
    result.cancelled = session.cancel_requested() && result.addresses_probed < result.addresses_total;
    result.devices = session.devices();
    Logger::instance().info("Scan complete: " + std::to_string(result.devices.size()) + " device(s) found, "
                            + std::to_string(result.addresses_probed) + "/" + std::to_string(result.addresses_total)
                            + " addresses probed" + (result.cancelled ? " (cancelled)" : ""));
    return result;
}

}
