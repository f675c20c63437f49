#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Base for long-running operations that own exactly one worker thread per run.
// Cancellation is cooperative: the worker polls checkCancelled() at file, poll-tick
// and phase granularity; nothing is interrupted mid-unit.
class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    Job();
    virtual ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    virtual void cancel();
    bool isCancelled() const { return cancelled_.load(); }
    bool isRunning() const { return running_.load(); }

    // Blocks until the current worker (if any) has finished.
    void wait();
    bool waitFor(std::chrono::milliseconds timeout);

    State getState() const;
    std::string getError() const;
    std::string getId() const;

protected:
    // Returns false when a run is already in progress.
    bool launch(std::function<void()> body);

    // Derived destructors call this before their members go away.
    void stopWorker();

    void checkCancelled() const;
    // Sleeps for up to `duration`; returns false if cancelled meanwhile.
    bool sleepUnlessCancelled(std::chrono::milliseconds duration);

    void setState(State state);
    void setError(const std::string& error);
    std::string generateId() const;

private:
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    std::condition_variable doneCondition_;
    std::condition_variable cancelCondition_;
    State state_{State::PENDING};
    std::string error_;
    std::string id_;
};
