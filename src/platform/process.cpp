#include "askills/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace askills {

#ifndef _WIN32

CaptureResult run_capture(const std::vector<std::string>& argv_strings, const std::string& cwd,
                          size_t max_output) {
    CaptureResult result;
    if (argv_strings.empty()) {
        result.error = "empty argv";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe(fds) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        dup2(fds[1], STDOUT_FILENO);
        close(fds[0]);
        close(fds[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    close(fds[1]);
    char buffer[4096];
    while (true) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        size_t room = max_output > result.output.size() ? max_output - result.output.size() : 0;
        result.output.append(buffer, std::min(room, static_cast<size_t>(n)));
    }
    close(fds[0]);

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#else

CaptureResult run_capture(const std::vector<std::string>&, const std::string&, size_t) {
    CaptureResult result;
    result.error = "subprocess capture is not supported on this platform";
    return result;
}

#endif

} // namespace askills
