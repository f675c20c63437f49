#pragma once

#include "common/logger.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Fan-out of progress snapshots. Each observer is invoked in isolation: an exception
// from one is logged and does not reach the publisher or the remaining observers.
template <typename Snapshot>
class ObserverList {
public:
    using Observer = std::function<void(const Snapshot&)>;

    void add(Observer observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observers_.push_back(std::move(observer));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        observers_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return observers_.size();
    }

    void notify(const Snapshot& snapshot) const {
        std::vector<Observer> observers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            observers = observers_;
        }

        for (const auto& observer : observers) {
            try {
                observer(snapshot);
            } catch (const std::exception& e) {
                Logger::warning(std::string("Progress observer failed: ") + e.what());
            } catch (...) {
                Logger::warning("Progress observer failed with unknown error");
            }
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<Observer> observers_;
};
