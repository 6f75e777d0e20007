#pragma once

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <string>

class i_datagram_socket
{

public:
    virtual ~i_datagram_socket() = default;

    // one datagram to the fixed destination
    virtual ssize_t send_to_peer(const char *buf, const size_t len) = 0;

    // blocks until a datagram arrives, empty once interrupted
    virtual std::optional<size_t> receive(char *buf, const size_t cap) = 0;

    // wakes a blocked receive() for good
    virtual void interrupt() = 0;

    virtual std::string peer_name() const = 0;
};
