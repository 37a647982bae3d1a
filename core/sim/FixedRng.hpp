#pragma once

#include "../IRng.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>

namespace hublink::sim {

// Deterministic RNG: every draw lands at the same fraction of the requested
// range (0.0 = min, 0.5 = midpoint, values close to 1.0 approach max).
class FixedRng : public IRng {
public:
    explicit FixedRng(double fraction = 0.5) : fraction_(std::clamp(fraction, 0.0, 1.0)) {}

    double uniform(double min, double max) override {
        draws_.fetch_add(1);
        return min + fraction_ * (max - min);
    }

    int uniformInt(int min, int max) override {
        draws_.fetch_add(1);
        return min + static_cast<int>(std::floor(fraction_ * (max - min)));
    }

    int draws() const { return draws_.load(); }

private:
    double fraction_;
    std::atomic<int> draws_{0};
};

} // namespace hublink::sim
