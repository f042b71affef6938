#include "SystemNetworkEnvironment.h"
#include "CidrExpander.h"
#include "../core/Logging.h"
#include "../core/Process.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace cam_scan {

namespace {
    // Closes the descriptor on every exit path of a probe.
    class SocketGuard {
    public:
        explicit SocketGuard(int fd) : fd_(fd) {}
        ~SocketGuard(){ if(fd_ >= 0) close(fd_); }
        SocketGuard(const SocketGuard&) = delete;
        SocketGuard& operator=(const SocketGuard&) = delete;
        int get() const { return fd_; }
    private:
        int fd_;
    };
}

std::vector<std::string> SystemNetworkEnvironment::detect_local_subnets(){
    std::vector<std::string> subnets;
    struct ifaddrs* ifap = nullptr;
    if(getifaddrs(&ifap) != 0){
        Logger::instance().error(std::string("Error detecting subnets: ") + std::strerror(errno));
        return {kDefaultSubnet};
    }
    for(auto* ifa = ifap; ifa; ifa = ifa->ifa_next){
        if(!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if(ifa->ifa_flags & IFF_LOOPBACK) continue;
        if(!(ifa->ifa_flags & IFF_UP)) continue;
        auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        uint32_t ip = ntohl(sin->sin_addr.s_addr);
        if((ip >> 24) == 127) continue;
        std::string subnet = format_ipv4(ip & 0xFFFFFF00u) + "/24";
        if(std::find(subnets.begin(), subnets.end(), subnet) == subnets.end()) subnets.push_back(subnet);
    }
    freeifaddrs(ifap);
    if(subnets.empty()){
        Logger::instance().warn(std::string("No IPv4 interface found, falling back to ") + kDefaultSubnet);
        return {kDefaultSubnet};
    }
    return subnets;
}

bool SystemNetworkEnvironment::ping_host(const std::string& address, int timeout_seconds){
    uint32_t ip = 0;
    if(!parse_ipv4(address, ip)) return false;
    auto res = run_command({"ping", "-c", "1", "-W", std::to_string(timeout_seconds), address},
                           std::chrono::seconds(timeout_seconds + ping_grace_seconds_));
    if(res.timed_out) Logger::instance().trace("ping " + address + ": killed at deadline");
    return res.ok();
}

bool SystemNetworkEnvironment::probe_tcp_port(const std::string& address, uint16_t port, int timeout_seconds){
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if(inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) return false;

    SocketGuard sock(socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if(sock.get() < 0){
        Logger::instance().debug(std::string("socket() failed: ") + std::strerror(errno));
        return false;
    }
    int rc = connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if(rc == 0) return true;
    if(errno != EINPROGRESS) return false;

    pollfd p{sock.get(), POLLOUT, 0};
    int timeout_ms = timeout_seconds * 1000;
    int pr;
    do { pr = poll(&p, 1, timeout_ms); } while(pr < 0 && errno == EINTR);
    if(pr <= 0) return false; // timeout (filtered) or poll error

    int err = 0; socklen_t len = sizeof(err);
    if(getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0) return false;
    return err == 0;
}

std::vector<ArpEntry> SystemNetworkEnvironment::read_arp_table(){
    auto timeout = std::chrono::seconds(arp_timeout_seconds_);
    static const std::vector<std::vector<std::string>> commands = {
        {"arp", "-n"},
        {"ip", "neigh", "show"},
    };
    for(const auto& argv : commands){
        auto res = run_command(argv, timeout);
        if(res.ok()){
            Logger::instance().debug("ARP table read via '" + argv[0] + "'");
            return parse_arp_dump(res.output);
        }
        Logger::instance().debug("ARP source '" + argv[0] + "' unavailable (exit=" + std::to_string(res.exit_code)
                                 + (res.timed_out ? ", timed out" : "") + ")");
    }
    std::ifstream proc("/proc/net/arp");
    if(proc){
        std::stringstream ss; ss << proc.rdbuf();
        Logger::instance().debug("ARP table read via /proc/net/arp");
        return parse_arp_dump(ss.str());
    }
    Logger::instance().warn("ARP table unavailable; continuing without MAC resolution");
    return {};
}

}
