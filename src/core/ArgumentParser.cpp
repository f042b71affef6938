#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace cam_scan {

static int need_int(const std::string& v, const char* flag){
    size_t pos = 0; int n = 0;
    try { n = std::stoi(v, &pos); } catch(const std::exception&) { pos = 0; }
    if(pos == 0 || pos != v.size()) throw std::invalid_argument(std::string("Invalid integer for ") + flag + ": " + v);
    return n;
}

std::vector<std::string> ArgumentParser::split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else if(c!=' ') cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--subnets", ArgKind::CSV, "cidr[,cidr...]", "Subnets to scan (default: detect local /24s)",
            [](Config& c, const std::string& v){ c.subnets = split_csv(v); }},
        {"--workers", ArgKind::Int, "N", "Max simultaneous host probes (default 50)",
            [](Config& c, const std::string& v){ c.max_workers = need_int(v, "--workers"); }},
        {"--ping-timeout", ArgKind::Int, "S", "ICMP echo timeout in seconds (default 1)",
            [](Config& c, const std::string& v){ c.ping_timeout_seconds = need_int(v, "--ping-timeout"); }},
        {"--ping-grace", ArgKind::Int, "S", "Extra seconds before the ping process is killed (default 2)",
            [](Config& c, const std::string& v){ c.ping_grace_seconds = need_int(v, "--ping-grace"); }},
        {"--port-timeout", ArgKind::Int, "S", "TCP connect timeout in seconds (default 1)",
            [](Config& c, const std::string& v){ c.port_timeout_seconds = need_int(v, "--port-timeout"); }},
        {"--arp-timeout", ArgKind::Int, "S", "Timeout for the ARP table dump (default 10)",
            [](Config& c, const std::string& v){ c.arp_timeout_seconds = need_int(v, "--arp-timeout"); }},
        {"--oui-file", ArgKind::String, "FILE", "Extra OUI entries (class,XX:XX:XX,Manufacturer)",
            [](Config& c, const std::string& v){ c.oui_file = v; }},
        {"--only", ArgKind::CSV, "class[,class...]", "Only report camera|infrastructure|unknown",
            [](Config& c, const std::string& v){ c.class_filter = split_csv(v); }},
        {"--output", ArgKind::String, "FILE", "Write JSON to FILE (default stdout)",
            [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", ArgKind::None, nullptr, "Pretty-print JSON",
            [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, nullptr, "Minified JSON output",
            [](Config& c, const std::string&){ c.compact = true; }},
        {"--ndjson", ArgKind::None, nullptr, "Emit NDJSON (meta, summary, devices)",
            [](Config& c, const std::string&){ c.ndjson = true; }},
        {"--canonical", ArgKind::None, nullptr, "Order devices by address",
            [](Config& c, const std::string&){ c.canonical = true; }},
        {"--log-level", ArgKind::String, "LEVEL", "error|warn|info|debug|trace (default info)",
            [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--drop-priv", ArgKind::None, nullptr, "Drop Linux capabilities except CAP_NET_RAW",
            [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--no-hostname-meta", ArgKind::None, nullptr, "Suppress hostname in meta",
            [](Config& c, const std::string&){ c.no_hostname_meta = true; }},
        {"--fail-on-empty", ArgKind::None, nullptr, "Exit 1 when no device is found",
            [](Config& c, const std::string&){ c.fail_on_empty = true; }},
    };
}

void ArgumentParser::print_help() const {
    std::cout << "cam-scan options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.value_name){ name += ' '; name += s.value_name; }
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

void ArgumentParser::print_version() const {
    std::cout << "cam-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    for(int i=1; i<argc; ++i){
        if(!argv[i]){ continue; }
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = nullptr;
        for(const auto& s : specs_) if(a == s.name){ spec = &s; break; }
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc || !argv[i+1]){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const std::invalid_argument& ex){
            std::cerr << ex.what() << "\n";
            exit_code_ = 2;
            return false;
        }
    }
    return true;
}

}
