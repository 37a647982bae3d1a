#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hublink::domain {

// Fire-and-forget tasks whose failures stay observable: an exception escaping
// a task is logged and counted instead of terminating the process.
class BackgroundTaskSet {
public:
    BackgroundTaskSet() = default;
    ~BackgroundTaskSet();

    BackgroundTaskSet(const BackgroundTaskSet&) = delete;
    BackgroundTaskSet& operator=(const BackgroundTaskSet&) = delete;

    void spawn(const std::string& name, std::function<void()> task);

    // Blocks until every spawned task, including ones spawned meanwhile, finished
    void drain();

    std::size_t failureCount() const { return failures_.load(); }
    std::size_t pendingCount() const;

private:
    struct Task {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void reapFinished();

    mutable std::mutex mutex_;
    std::list<std::shared_ptr<Task>> tasks_;
    std::atomic<std::size_t> failures_{0};
};

} // namespace hublink::domain
