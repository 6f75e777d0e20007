#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>

using connection_id = uint32_t;
using sequence_number = uint32_t;

using steady_clock = std::chrono::steady_clock;
using timepoint = steady_clock::time_point;
using duration_ms = std::chrono::milliseconds;

inline constexpr connection_id INVALID_CONNECTION_ID = 0;

inline constexpr size_t MAX_DATA_SIZE = 32768;   // payload bytes per packet
inline constexpr size_t MAX_PACKET_SIZE = 33000; // whole datagram
inline constexpr size_t MAX_SINGLE_SEND = 5;     // window size, stop-and-wait never uses more than 1

// longest retransmission timeout accepted anywhere
inline constexpr duration_ms MAX_RETRANSMISSION_TIMEOUT = std::chrono::hours(24);

// now + timeout, saturating at timepoint::max() instead of wrapping
inline timepoint deadline_after(duration_ms timeout)
{
    timepoint now = steady_clock::now();
    if (timeout >= std::chrono::duration_cast<duration_ms>(timepoint::max() - now))
        return timepoint::max();
    return now + timeout;
}

inline std::mt19937_64 &get_rng()
{
    static const auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    static std::mt19937_64 generator(static_cast<uint64_t>(seed));
    return generator;
}

inline connection_id get_random_connection_id()
{
    static std::uniform_int_distribution<connection_id> distribution(1u, UINT32_MAX);
    return distribution(get_rng());
}
