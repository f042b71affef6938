#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace cam_scan {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the program should exit right away: --help / --version
    // (exit_code() == 0) or a usage error (exit_code() == 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help() const;
    void print_version() const;

    static std::vector<std::string> split_csv(const std::string& s);
private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* value_name;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };
    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

}
