#include "Logging.h"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace cam_scan {

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s=="error"){ out = LogLevel::Error; return true; }
    if(s=="warn" || s=="warning"){ out = LogLevel::Warn; return true; }
    if(s=="info"){ out = LogLevel::Info; return true; }
    if(s=="debug"){ out = LogLevel::Debug; return true; }
    if(s=="trace"){ out = LogLevel::Trace; return true; }
    return false;
}

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{}; gmtime_r(&t, &tm);
    char ts[32]; std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << " [" << prefix(lvl) << "] " << msg << "\n";
}

}
