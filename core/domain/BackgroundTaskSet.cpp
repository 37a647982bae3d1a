#include "BackgroundTaskSet.hpp"
#include "../Logger.hpp"
#include <exception>

namespace hublink::domain {

BackgroundTaskSet::~BackgroundTaskSet() {
    drain();
}

void BackgroundTaskSet::spawn(const std::string& name, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reapFinished();

    auto entry = std::make_shared<Task>();
    entry->thread = std::thread([this, entry, name, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            failures_.fetch_add(1);
            logError("Tasks") << "background task '" << name << "' failed: " << e.what();
        }
        entry->done.store(true);
    });
    tasks_.push_back(std::move(entry));
}

void BackgroundTaskSet::drain() {
    for (;;) {
        std::list<std::shared_ptr<Task>> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) {
                return;
            }
            batch.swap(tasks_);
        }
        for (auto& task : batch) {
            if (task->thread.joinable() && task->thread.get_id() != std::this_thread::get_id()) {
                task->thread.join();
            } else if (task->thread.joinable()) {
                task->thread.detach();
            }
        }
    }
}

std::size_t BackgroundTaskSet::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t pending = 0;
    for (const auto& task : tasks_) {
        if (!task->done.load()) {
            ++pending;
        }
    }
    return pending;
}

void BackgroundTaskSet::reapFinished() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if ((*it)->done.load()) {
            (*it)->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace hublink::domain
