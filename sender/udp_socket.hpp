#pragma once

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>

#include "../common/logger.hpp"
#include "i_datagram_socket.hpp"

// Blocks on epoll_fd until socket_fd yields a datagram. Empty once
// `interrupted` is set, or when epoll itself fails, since retrying a broken
// epoll set would only spin.
inline std::optional<size_t> receive_when_readable(int epoll_fd, int socket_fd,
                                                   const std::atomic<bool> &interrupted,
                                                   char *buf, const size_t cap)
{
    epoll_event events[2];

    while (!interrupted.load())
    {
        int event_cnt = epoll_wait(epoll_fd, events, 2, -1);
        if (event_cnt == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[receive] epoll_wait error: " << strerror(errno));
            return std::nullopt;
        }

        for (int i = 0; i < event_cnt; i++)
        {
            if (events[i].data.fd != socket_fd)
                continue;

            ssize_t n = recv(socket_fd, buf, cap, 0);
            if (n >= 0)
                return static_cast<size_t>(n);

            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                LOG_ERROR("[receive] recv failed: " << strerror(errno));
        }
    }

    return std::nullopt;
}

// IPv4 UDP socket bound to one local port and aimed at one destination.
class udp_socket final : public i_datagram_socket
{
    int socket_fd = -1;
    int epoll_fd = -1;
    int wake_fd = -1;

    sockaddr_in peer_addr{};
    std::string peer;
    uint16_t bound_port = 0;

    std::atomic<bool> interrupted{false};

    [[noreturn]] static void throw_errno(const std::string &what)
    {
        throw std::system_error(errno, std::generic_category(), what);
    }

    static sockaddr_in resolve(const std::string &host, uint16_t port, bool passive)
    {
        addrinfo hints{}, *results = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        if (passive)
            hints.ai_flags = AI_PASSIVE;

        std::string service = std::to_string(port);
        int res = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &results);
        if (res != 0)
            throw std::system_error(EINVAL, std::generic_category(),
                                    "getaddrinfo(" + host + ") failed: " + gai_strerror(res));

        sockaddr_in out{};
        memcpy(&out, results->ai_addr, sizeof(out));
        freeaddrinfo(results);
        return out;
    }

    void set_non_blocking(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1)
            throw_errno("fcntl(F_GETFL)");
        if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            throw_errno("fcntl(F_SETFL)");
    }

    void bind_socket(const std::string &host, uint16_t port)
    {
        socket_fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (socket_fd == -1)
            throw_errno("socket");

        set_non_blocking(socket_fd);

        sockaddr_in local = resolve(host, port, true);
        if (::bind(socket_fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == -1)
            throw_errno("bind " + host + ":" + std::to_string(port));

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(socket_fd, reinterpret_cast<sockaddr *>(&bound), &len) == -1)
            throw_errno("getsockname");
        bound_port = ntohs(bound.sin_port);
    }

    void setup_epoll()
    {
        epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd == -1)
            throw_errno("epoll_create1");

        wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd == -1)
            throw_errno("eventfd");

        epoll_event ev{};
        ev.events = EPOLLIN;

        ev.data.fd = socket_fd;
        if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, socket_fd, &ev) == -1)
            throw_errno("epoll_ctl add socket");

        ev.data.fd = wake_fd;
        if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, wake_fd, &ev) == -1)
            throw_errno("epoll_ctl add wake_fd");
    }

    void close_all()
    {
        if (socket_fd != -1)
            close(socket_fd);
        if (wake_fd != -1)
            close(wake_fd);
        if (epoll_fd != -1)
            close(epoll_fd);
        socket_fd = wake_fd = epoll_fd = -1;
    }

public:
    // local_port 0 lets the kernel pick one, see local_port()
    udp_socket(const std::string &local_host, uint16_t local_port,
               const std::string &dest_host, uint16_t dest_port)
    {
        try
        {
            peer_addr = resolve(dest_host, dest_port, false);
            peer = dest_host + ":" + std::to_string(dest_port);
            bind_socket(local_host, local_port);
            setup_epoll();
        }
        catch (const std::system_error &e)
        {
            LOG_ERROR("[udp_socket] setup failed: " << e.what());
            close_all();
            throw;
        }

        LOG_DEBUG("[udp_socket] bound port " << bound_port << " -> " << peer);
    }

    udp_socket(const udp_socket &) = delete;
    udp_socket &operator=(const udp_socket &) = delete;
    udp_socket(udp_socket &&) = delete;
    udp_socket &operator=(udp_socket &&) = delete;

    ~udp_socket() override
    {
        LOG_DEBUG("[udp_socket] closing port " << bound_port);
        close_all();
    }

    uint16_t local_port() const { return bound_port; }

    std::string peer_name() const override { return peer; }

    ssize_t send_to_peer(const char *buf, const size_t len) override
    {
        ssize_t sent = sendto(socket_fd, buf, len, 0,
                              reinterpret_cast<const sockaddr *>(&peer_addr), sizeof(peer_addr));
        if (sent == -1)
        {
            // a full send buffer is just another lost datagram
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                LOG_WARN("[send] send would block, datagram dropped.");
                return -1;
            }
            throw_errno("sendto " + peer);
        }
        return sent;
    }

    std::optional<size_t> receive(char *buf, const size_t cap) override
    {
        return receive_when_readable(epoll_fd, socket_fd, interrupted, buf, cap);
    }

    void interrupt() override
    {
        interrupted.store(true);
        uint64_t one = 1;
        if (write(wake_fd, &one, sizeof(one)) == -1)
            LOG_ERROR("[interrupt] eventfd write failed: " << strerror(errno));
    }
};
