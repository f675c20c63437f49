#include "common/subprocess.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kPollSliceMs = 200;

void terminateChild(pid_t pid) {
    kill(pid, SIGTERM);
    for (int i = 0; i < 10; ++i) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) {
            return;
        }
        usleep(100 * 1000);
    }
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // namespace

SubprocessResult Subprocess::run(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout,
                                  const StopPredicate& shouldStop) {
    SubprocessResult result;
    if (argv.empty()) {
        result.output = "empty command line";
        return result;
    }

    int fds[2];
    if (pipe(fds) != 0) {
        result.output = std::string("pipe failed: ") + strerror(errno);
        Logger::error(result.output);
        return result;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        result.output = std::string("fork failed: ") + strerror(errno);
        Logger::error(result.output);
        return result;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);
    fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);

    auto started = std::chrono::steady_clock::now();
    bool outputOpen = true;
    int status = 0;
    bool exited = false;
    char buffer[4096];

    while (!exited) {
        if (outputOpen) {
            pollfd pfd{fds[0], POLLIN, 0};
            if (poll(&pfd, 1, kPollSliceMs) > 0) {
                ssize_t n = read(fds[0], buffer, sizeof(buffer));
                if (n > 0) {
                    result.output.append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    outputOpen = false;
                }
            }
        } else {
            usleep(kPollSliceMs * 1000);
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
            break;
        }

        if (shouldStop && shouldStop()) {
            terminateChild(pid);
            result.interrupted = true;
            break;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - started > timeout) {
            terminateChild(pid);
            result.timedOut = true;
            Logger::warning("Command timed out: " + argv[0]);
            break;
        }
    }

    // Drain whatever the child wrote before it exited
    if (outputOpen) {
        ssize_t n;
        while ((n = read(fds[0], buffer, sizeof(buffer))) > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        }
    }
    close(fds[0]);

    if (exited) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
    }
    return result;
}

SubprocessResult Subprocess::runShell(const std::string& command, std::chrono::milliseconds timeout) {
    Logger::debug("Running: " + command);
    return run({"/bin/sh", "-c", command}, timeout);
}

bool Subprocess::existsInPath(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return false;
    }

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + program;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
