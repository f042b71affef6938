#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include <cstdint>
#include <iostream>
#include <vector>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // argv[0] plus whitespace-separated tokens
    std::vector<std::string> args{"cam-scan"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // usage errors and help text go to the streams; keep the fuzzer quiet
    std::cout.setstate(std::ios::failbit);
    std::cerr.setstate(std::ios::failbit);

    cam_scan::ArgumentParser parser;
    cam_scan::Config cfg;
    if (parser.parse(static_cast<int>(args.size()), argv.data(), cfg)) {
        cam_scan::ConfigValidator validator;
        (void)validator.validate(cfg);
    }
    return 0;
}
