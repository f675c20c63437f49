#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct SubprocessResult {
    int exitCode = -1;
    bool timedOut = false;
    bool interrupted = false;  // stopped because the caller asked to stop
    std::string output;        // combined stdout/stderr
};

class Subprocess {
public:
    using StopPredicate = std::function<bool()>;

    // Runs argv[0] (looked up in PATH) and waits for it. A zero timeout waits forever.
    // The stop predicate is polled a few times per second; when it returns true the
    // child is terminated.
    static SubprocessResult run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                                const StopPredicate& shouldStop = nullptr);

    // Runs `command` through /bin/sh -c.
    static SubprocessResult runShell(const std::string& command,
                                     std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    static bool existsInPath(const std::string& program);
};
