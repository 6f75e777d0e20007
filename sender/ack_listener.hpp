#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "../common/ack_signal.hpp"
#include "../common/logger.hpp"
#include "../common/packet.hpp"
#include "../common/pending_queue.hpp"
#include "../common/types.hpp"
#include "i_datagram_socket.hpp"

// Drains acknowledgments for one connection until its FIN-ACK arrives.
class ack_listener
{
    connection_id id_;
    std::shared_ptr<pending_queue> pending_;
    std::shared_ptr<ack_signal> signal_;
    std::shared_ptr<i_datagram_socket> socket_;

    std::atomic<bool> stopped_{false};
    std::atomic<size_t> received_{0};
    std::atomic<size_t> matched_{0};
    std::atomic<size_t> ignored_{0};

    void on_datagram(const char *buf, size_t len)
    {
        received_.fetch_add(1, std::memory_order_relaxed);

        std::optional<packet> ack = packet::decode(buf, len);
        if (!ack)
        {
            LOG_DEBUG("[ack_listener " << id_ << "] undecodable datagram of " << len << " bytes");
            ignored_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        LOG_INFO(socket_->peer_name() << " -> " << *ack);

        if (pending_->remove_acknowledged(*ack))
            matched_.fetch_add(1, std::memory_order_relaxed);
        else
            ignored_.fetch_add(1, std::memory_order_relaxed);

        if (ack->type() == packet_type::FIN_ACK && ack->id() == id_)
            stopped_.store(true);
    }

public:
    ack_listener(connection_id id,
                 std::shared_ptr<pending_queue> pending,
                 std::shared_ptr<ack_signal> signal,
                 std::shared_ptr<i_datagram_socket> socket)
        : id_(id), pending_(std::move(pending)), signal_(std::move(signal)), socket_(std::move(socket))
    {
    }

    ack_listener(const ack_listener &) = delete;
    ack_listener &operator=(const ack_listener &) = delete;

    void run()
    {
        std::vector<char> buf(MAX_PACKET_SIZE);

        while (!stopped_.load())
        {
            std::optional<size_t> n = socket_->receive(buf.data(), buf.size());
            if (!n)
            {
                LOG_WARN("[ack_listener " << id_ << "] interrupted before FIN-ACK");
                break;
            }

            on_datagram(buf.data(), *n);

            // every datagram wakes the sender, it re-checks the queue itself
            signal_->raise();
        }

        if (stopped_.load())
            LOG_INFO("[i] All packets for id " << id_ << " acknowledged!");
    }

    bool finished() const { return stopped_.load(); }
    size_t received() const { return received_.load(); }
    size_t matched() const { return matched_.load(); }
    size_t ignored() const { return ignored_.load(); }
};
