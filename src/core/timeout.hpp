#pragma once

#include <algorithm>
#include <chrono>

namespace timeout {

// Operation-wide deadline in seconds, scaled with the audio length so long
// clips are not aborted by a fixed limit.
inline double compute(double duration, double base_timeout, double multiplier) {
    return std::max(base_timeout, duration * multiplier);
}

// Deadline clock started once per operation.
class Budget {
public:
    using Clock = std::chrono::steady_clock;

    Budget(Clock::time_point started, double deadline_s)
        : started_(started), deadline_s_(deadline_s) {}

    double deadline() const { return deadline_s_; }

    double elapsed(Clock::time_point now) const {
        return std::chrono::duration<double>(now - started_).count();
    }

    bool expired(Clock::time_point now) const { return elapsed(now) >= deadline_s_; }

private:
    Clock::time_point started_;
    double deadline_s_;
};

} // namespace timeout
