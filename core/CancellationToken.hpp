/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared across the whole call graph
 *
 * A CancellationSource owns the cancellation state; CancellationTokens are
 * cheap copies handed to every blocking or sleeping operation. A source may
 * carry a deadline, after which it reports itself cancelled (the optional
 * application run-time bound).
 *
 * @date 2025
 * @version 1.0
 *
 * @note Tokens are passed by argument, never stored in static state
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace hublink {

namespace detail {
struct CancellationState;
}

/**
 * @brief Read-only view of a cancellation source
 */
class CancellationToken {
public:
    /// Token that is never cancelled (used for final cleanup operations)
    static CancellationToken none();

    /// @return true once the owning source was cancelled or its deadline passed
    bool isCancellationRequested() const;

    /**
     * @brief Sleep for @p duration unless cancellation is requested first
     * @return true if the full duration elapsed, false if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner of a cancellation signal
 */
class CancellationSource {
public:
    CancellationSource();

    /// Source that cancels itself once @p lifetime has elapsed
    explicit CancellationSource(std::chrono::milliseconds lifetime);

    void cancel();
    bool isCancellationRequested() const;
    CancellationToken token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace hublink
