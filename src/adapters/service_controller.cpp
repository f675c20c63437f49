#include "adapters/service_controller.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include <chrono>
#include <thread>

CommandServiceController::CommandServiceController(const ServiceSettings& settings)
    : settings_(settings) {
}

bool CommandServiceController::runCommand(const std::string& command, const char* action) {
    lastError_.clear();
    if (command.empty()) {
        lastError_ = std::string("No ") + action + " command configured";
        return false;
    }

    SubprocessResult result = Subprocess::runShell(
        command, std::chrono::seconds(settings_.commandTimeoutSeconds));
    if (result.timedOut) {
        lastError_ = std::string("Service ") + action + " timed out";
        return false;
    }
    if (result.exitCode != 0) {
        lastError_ = std::string("Service ") + action + " failed with exit code " +
                     std::to_string(result.exitCode) + (result.output.empty() ? "" : ": " + result.output);
        return false;
    }
    return true;
}

bool CommandServiceController::isRunning() {
    return runCommand(settings_.statusCommand, "status");
}

bool CommandServiceController::stop() {
    Logger::info("Stopping managed service");
    if (!runCommand(settings_.stopCommand, "stop")) {
        Logger::error(lastError_);
        return false;
    }
    if (settings_.settleSeconds > 0) {
        std::this_thread::sleep_for(std::chrono::seconds(settings_.settleSeconds));
    }
    return true;
}

bool CommandServiceController::start() {
    Logger::info("Starting managed service");
    if (!runCommand(settings_.startCommand, "start")) {
        Logger::error(lastError_);
        return false;
    }
    return true;
}

ServiceStopGuard::ServiceStopGuard(ServiceController& controller, WarningSink onWarning,
                                   std::function<void()> beforeRestart)
    : controller_(controller)
    , onWarning_(std::move(onWarning))
    , beforeRestart_(std::move(beforeRestart)) {
}

ServiceStopGuard::~ServiceStopGuard() {
    try {
        restart();
    } catch (const std::exception& e) {
        Logger::error(std::string("Service restart during cleanup failed: ") + e.what());
    }
}

bool ServiceStopGuard::stopIfRunning() {
    if (stopped_ || !controller_.isRunning()) {
        return false;
    }

    if (!controller_.stop()) {
        if (onWarning_) {
            onWarning_("Failed to stop service: " + controller_.getLastError());
        }
        return false;
    }
    stopped_ = true;
    return true;
}

void ServiceStopGuard::restart() {
    if (!stopped_) {
        return;
    }
    stopped_ = false;

    if (beforeRestart_) {
        beforeRestart_();
    }
    if (!controller_.start()) {
        Logger::error("Managed service did not restart: " + controller_.getLastError());
        if (onWarning_) {
            onWarning_("Failed to restart service: " + controller_.getLastError());
        }
    }
}
