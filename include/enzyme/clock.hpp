#ifndef ENZYME_CLOCK_HPP
#define ENZYME_CLOCK_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "errors.hpp"

namespace enzyme {

// =============================================================================
// ChainClock - simulated block timestamp
// =============================================================================
// Time only moves forward, and only when the caller says so. Nothing in the
// engine reads wall-clock time. Timestamp 0 marks a fee that was never
// settled, so a clock cannot start there.

class ChainClock {
public:
    // Throws InvalidSettingsError for a zero start
    explicit ChainClock(uint64_t start) : now_(start) {
        if (start == 0) {
            throw InvalidSettingsError("clock must start after timestamp 0");
        }
    }

    // Non-copyable
    ChainClock(const ChainClock&) = delete;
    ChainClock& operator=(const ChainClock&) = delete;

    uint64_t now() const { return now_.load(std::memory_order_acquire); }

    void advance(uint64_t seconds) { now_.fetch_add(seconds, std::memory_order_acq_rel); }

    // Throws NotMonotonicError if timestamp is in the past
    void set(uint64_t timestamp) {
        uint64_t current = now_.load(std::memory_order_acquire);
        do {
            if (timestamp < current) {
                throw NotMonotonicError("clock cannot move back from " + std::to_string(current) +
                                        " to " + std::to_string(timestamp));
            }
        } while (!now_.compare_exchange_weak(current, timestamp, std::memory_order_acq_rel));
    }

private:
    std::atomic<uint64_t> now_;
};

} // namespace enzyme

#endif // ENZYME_CLOCK_HPP
