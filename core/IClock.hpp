#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hublink {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual std::uint64_t epochSeconds() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    std::uint64_t epochSeconds() const override {
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count());
    }

    std::string iso8601() const override;
};

/// Clock pinned to a fixed instant; used for reproducible SAS tokens
class FixedClock : public IClock {
public:
    explicit FixedClock(std::uint64_t epochSeconds) : epochSeconds_(epochSeconds) {}

    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point(std::chrono::seconds(epochSeconds_));
    }

    std::uint64_t epochSeconds() const override { return epochSeconds_; }

    std::string iso8601() const override;

private:
    std::uint64_t epochSeconds_;
};

/// Format a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatIso8601(std::chrono::system_clock::time_point time);

} // namespace hublink
