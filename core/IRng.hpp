#pragma once

#include <mutex>
#include <random>

namespace hublink {

class IRng {
public:
    virtual ~IRng() = default;

    virtual double uniform(double min = 0.0, double max = 1.0) = 0;
    virtual int uniformInt(int min, int max) = 0;
};

// Shared generator; every draw takes the lock so one instance can serve
// concurrent retry loops.
class StandardRng : public IRng {
public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(std::mt19937::result_type seed) : gen_(seed) {}

    double uniform(double min = 0.0, double max = 1.0) override {
        std::uniform_real_distribution<double> dist(min, max);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(gen_);
    }

    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(gen_);
    }

private:
    std::mutex mutex_;
    std::mt19937 gen_;
};

} // namespace hublink
