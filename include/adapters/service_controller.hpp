#pragma once

#include "common/settings.hpp"
#include <functional>
#include <string>

class ServiceController {
public:
    virtual ~ServiceController() = default;

    virtual bool isRunning() = 0;
    virtual bool stop() = 0;
    virtual bool start() = 0;
    virtual std::string getLastError() const = 0;
};

// Runs the configured status/stop/start shell commands.
class CommandServiceController : public ServiceController {
public:
    explicit CommandServiceController(const ServiceSettings& settings);

    bool isRunning() override;
    bool stop() override;
    bool start() override;
    std::string getLastError() const override { return lastError_; }

private:
    bool runCommand(const std::string& command, const char* action);

    ServiceSettings settings_;
    std::string lastError_;
};

// Stops the managed service for the lifetime of the guard and starts it again on
// every exit path, including exceptions and cancellation.
class ServiceStopGuard {
public:
    using WarningSink = std::function<void(const std::string&)>;

    ServiceStopGuard(ServiceController& controller, WarningSink onWarning,
                     std::function<void()> beforeRestart = nullptr);
    ~ServiceStopGuard();

    ServiceStopGuard(const ServiceStopGuard&) = delete;
    ServiceStopGuard& operator=(const ServiceStopGuard&) = delete;

    // Stops the service if it is running. Returns true when this guard stopped it.
    bool stopIfRunning();
    // Starts the service again if this guard stopped it. Safe to call more than once.
    void restart();

    bool stoppedService() const { return stopped_; }

private:
    ServiceController& controller_;
    WarningSink onWarning_;
    std::function<void()> beforeRestart_;
    bool stopped_ = false;
};
