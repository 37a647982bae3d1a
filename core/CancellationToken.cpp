#include "CancellationToken.hpp"
#include <thread>

namespace hublink {

namespace detail {

struct CancellationState {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    bool expired(std::chrono::steady_clock::time_point now) const {
        return cancelled || (deadline && now >= *deadline);
    }
};

} // namespace detail

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

CancellationToken CancellationToken::none() {
    return CancellationToken(nullptr);
}

bool CancellationToken::isCancellationRequested() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->expired(std::chrono::steady_clock::now());
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    const auto until = std::chrono::steady_clock::now() + duration;

    if (!state_) {
        std::this_thread::sleep_until(until);
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    auto wakeAt = until;
    if (state_->deadline && *state_->deadline < wakeAt) {
        wakeAt = *state_->deadline;
    }
    state_->cv.wait_until(lock, wakeAt, [this, wakeAt] {
        return state_->expired(std::chrono::steady_clock::now()) ||
               std::chrono::steady_clock::now() >= wakeAt;
    });
    return !state_->expired(std::chrono::steady_clock::now());
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(std::chrono::milliseconds lifetime)
    : CancellationSource() {
    state_->deadline = std::chrono::steady_clock::now() + lifetime;
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::isCancellationRequested() const {
    return token().isCancellationRequested();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

} // namespace hublink
