#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "types.hpp"

// Reusable wake-up shared by a sender and its listener. Each raise() moves the
// generation forward, so a waiter that remembers the generation it last saw
// can never confuse an old raise with a new one.
class ack_signal
{
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_ = 0;

public:
    ack_signal() = default;

    ack_signal(const ack_signal &) = delete;
    ack_signal &operator=(const ack_signal &) = delete;

    void raise()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    uint64_t generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    // true if raised after `seen` before the deadline; `seen` is updated
    bool wait_until(uint64_t &seen, timepoint deadline)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool raised = cv_.wait_until(lock, deadline, [&]
                                     { return generation_ != seen; });
        if (raised)
            seen = generation_;
        return raised;
    }

    bool wait_for(uint64_t &seen, duration_ms timeout)
    {
        return wait_until(seen, deadline_after(timeout));
    }
};
