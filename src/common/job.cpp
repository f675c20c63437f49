#include "common/job.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : state_(State::PENDING) {
    id_ = generateId();
}

Job::~Job() {
    stopWorker();
}

bool Job::launch(std::function<void()> body) {
    if (running_.exchange(true)) {
        return false;
    }

    // The previous run has finished; reap its thread before starting another
    if (worker_.joinable()) {
        worker_.join();
    }

    cancelled_.store(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::RUNNING;
        error_.clear();
        id_ = generateId();
    }

    worker_ = std::thread([this, body]() {
        try {
            body();
        } catch (const std::exception& e) {
            Logger::error("Job " + getId() + " aborted: " + e.what());
            setError(e.what());
            setState(State::FAILED);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.store(false);
        }
        doneCondition_.notify_all();
    });

    return true;
}

void Job::stopWorker() {
    cancel();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void Job::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cancelCondition_.notify_all();
}

void Job::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    doneCondition_.wait(lock, [this]() { return !running_.load(); });
}

bool Job::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return doneCondition_.wait_for(lock, timeout, [this]() { return !running_.load(); });
}

void Job::checkCancelled() const {
    if (cancelled_.load()) {
        throw CancelledError();
    }
}

bool Job::sleepUnlessCancelled(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cancelCondition_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}
