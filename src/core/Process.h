#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace cam_scan {

struct CommandResult {
    bool started = false;   // fork succeeded
    bool timed_out = false; // child killed at the deadline
    int exit_code = -1;     // -1 when the child did not exit normally
    std::string output;     // captured stdout (stderr is discarded)

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Runs argv[0] (PATH lookup) without a shell. The child is SIGKILLed once timeout elapses.
// Exec failure surfaces as exit_code 127.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                          size_t max_output = 1024*1024);

}
