#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "packet.hpp"

// Unacknowledged packets of one connection, in send order. Shared by the
// sender (reads and transmits the head) and the ack listener (removes).
class pending_queue
{
    std::deque<packet> packets_;
    mutable std::mutex mutex_;

public:
    pending_queue() = default;

    template <typename It>
    pending_queue(It first, It last) : packets_(first, last) {}

    pending_queue(const pending_queue &) = delete;
    pending_queue &operator=(const pending_queue &) = delete;

    // WRITE
    void push_back(packet p)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        packets_.push_back(std::move(p));
    }

    // READ
    std::optional<packet> front() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (packets_.empty())
            return std::nullopt;
        return packets_.front();
    }

    // READ, fn runs with the queue locked so no removal can interleave
    template <typename F>
    std::optional<packet> transmit_front(F &&fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (packets_.empty())
            return std::nullopt;
        fn(packets_.front());
        return packets_.front();
    }

    // WRITE, duplicate acknowledgments find nothing and change nothing
    bool remove_acknowledged(const packet &ack)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = packets_.begin(); it != packets_.end(); ++it)
        {
            if (ack.acknowledges(*it))
            {
                packets_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return packets_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return packets_.size();
    }
};
