#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hublink::domain {

// Ordered candidate connection strings, consumed front to back. A discarded
// credential is never handed out again.
class CredentialSet {
public:
    explicit CredentialSet(std::vector<std::string> credentials);

    std::optional<std::string> head() const;

    // Position of the head within the original list (0 = primary)
    std::size_t headIndex() const;

    // Removes the head only if it still equals expected; returns the
    // number of credentials left afterwards.
    std::size_t discardIfHead(const std::string& expected);
    std::size_t discardHead();

    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::string> credentials_;
    std::size_t discarded_ = 0;
};

} // namespace hublink::domain
