#include "CredentialSet.hpp"
#include <stdexcept>

namespace hublink::domain {

CredentialSet::CredentialSet(std::vector<std::string> credentials) {
    for (auto& credential : credentials) {
        if (!credential.empty()) {
            credentials_.push_back(std::move(credential));
        }
    }
    if (credentials_.empty()) {
        throw std::invalid_argument("CredentialSet: at least one credential is required");
    }
}

std::optional<std::string> CredentialSet::head() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (credentials_.empty()) {
        return std::nullopt;
    }
    return credentials_.front();
}

std::size_t CredentialSet::headIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

std::size_t CredentialSet::discardIfHead(const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!credentials_.empty() && credentials_.front() == expected) {
        credentials_.pop_front();
        ++discarded_;
    }
    return credentials_.size();
}

std::size_t CredentialSet::discardHead() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!credentials_.empty()) {
        credentials_.pop_front();
        ++discarded_;
    }
    return credentials_.size();
}

std::size_t CredentialSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.size();
}

bool CredentialSet::empty() const {
    return size() == 0;
}

} // namespace hublink::domain
