#include "Process.h"
#include "Logging.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace cam_scan {

CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, size_t max_output){
    CommandResult res;
    if(argv.empty()) return res;

    // argv must be fully built before fork: the child only calls exec-safe functions
    std::vector<char*> cargv;
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0){
        Logger::instance().debug(std::string("pipe2 failed: ") + std::strerror(errno));
        return res;
    }

    pid_t pid = fork();
    if(pid < 0){
        Logger::instance().debug(std::string("fork failed for ") + argv[0] + ": " + std::strerror(errno));
        close(fds[0]); close(fds[1]);
        return res;
    }
    if(pid == 0){
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_RDWR);
        if(devnull >= 0){ dup2(devnull, STDERR_FILENO); dup2(devnull, STDIN_FILENO); }
        execvp(cargv[0], cargv.data());
        _exit(127);
    }
    res.started = true;
    close(fds[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    while(true){
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(remaining <= 0){ res.timed_out = true; break; }
        pollfd p{fds[0], POLLIN, 0};
        int pr = poll(&p, 1, static_cast<int>(remaining));
        if(pr < 0){ if(errno == EINTR) continue; break; }
        if(pr == 0){ res.timed_out = true; break; }
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if(n < 0){ if(errno == EINTR) continue; break; }
        if(n == 0) break; // EOF: child closed stdout
        size_t room = max_output - res.output.size(); // keep draining so the child never blocks on a full pipe
        res.output.append(buf, std::min(room, static_cast<size_t>(n)));
    }
    close(fds[0]);

    int status = 0;
    while(!res.timed_out){
        pid_t w = waitpid(pid, &status, WNOHANG);
        if(w == pid) break;
        if(w < 0){
            if(errno == EINTR) continue;
            Logger::instance().debug(std::string("waitpid failed: ") + std::strerror(errno));
            return res;
        }
        if(std::chrono::steady_clock::now() >= deadline){ res.timed_out = true; break; }
        usleep(5000);
    }
    if(res.timed_out){
        kill(pid, SIGKILL);
        while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return res;
    }
    if(WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    return res;
}

}
