#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "../common/ack_signal.hpp"
#include "../common/logger.hpp"
#include "../common/packet.hpp"
#include "../common/pending_queue.hpp"
#include "../common/types.hpp"
#include "ack_listener.hpp"
#include "i_datagram_socket.hpp"

enum class delivery_status
{
    DELIVERED,
    GAVE_UP,
};

struct sender_stats
{
    size_t transmissions = 0;
    size_t retransmissions = 0;
    size_t acknowledged = 0;
    size_t spurious_wakeups = 0;
    size_t dropped_sends = 0; // send buffer full, never left the host
};

/*
 * Stop-and-wait sender for one connection.
 *
 * Sends the head of the pending queue, then sleeps on the ack signal until
 * the retransmission deadline. A wake-up only counts as progress when the
 * head actually changed; anything else is spurious and the deadline stands.
 * On timeout the same head goes out again and the deadline restarts.
 *
 * max_retransmits == 0 retransmits forever.
 */
class reliable_sender
{
    std::shared_ptr<i_datagram_socket> socket_;
    std::shared_ptr<pending_queue> pending_;
    std::shared_ptr<ack_signal> signal_;
    duration_ms timeout_;
    uint32_t max_retransmits_;
    connection_id id_ = INVALID_CONNECTION_ID;

    std::atomic<size_t> transmissions_{0};
    std::atomic<size_t> retransmissions_{0};
    std::atomic<size_t> acknowledged_{0};
    std::atomic<size_t> spurious_wakeups_{0};
    std::atomic<size_t> dropped_sends_{0};

    static bool same_item(const packet &a, const packet &b)
    {
        return a.id() == b.id() && a.seq() == b.seq();
    }

    // caller holds the queue lock through transmit_front
    void transmit(const packet &p, bool retransmission)
    {
        std::vector<char> bytes = p.encode();
        if (socket_->send_to_peer(bytes.data(), bytes.size()) < 0)
        {
            // handled like a lost datagram: the timeout resends it
            dropped_sends_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN(socket_->peer_name() << " dropped " << p);
            return;
        }
        transmissions_.fetch_add(1, std::memory_order_relaxed);

        if (retransmission)
        {
            retransmissions_.fetch_add(1, std::memory_order_relaxed);
            LOG_INFO(socket_->peer_name() << " (Retransmission) <- " << p);
        }
        else
        {
            LOG_INFO(socket_->peer_name() << " <- " << p);
        }
    }

    bool head_moved_past(const packet &sent) const
    {
        std::optional<packet> head = pending_->front();
        return !head || !same_item(*head, sent);
    }

    // false once the retransmission budget for `sent` is spent
    bool await_acknowledgment(const packet &sent, uint64_t seen)
    {
        uint32_t retransmits = 0;
        timepoint deadline = deadline_after(timeout_);

        while (true)
        {
            if (signal_->wait_until(seen, deadline))
            {
                if (head_moved_past(sent))
                    return true;

                spurious_wakeups_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            if (max_retransmits_ != 0 && retransmits >= max_retransmits_)
            {
                LOG_CRITICAL("[reliable_sender " << id_ << "] " << sent << " reached max retransmits ("
                                                 << max_retransmits_ << "), giving up.");
                return false;
            }

            bool resent = false;
            pending_->transmit_front([&](const packet &head)
                                     {
                if (!same_item(head, sent))
                    return;
                transmit(head, true);
                resent = true; });

            // acknowledged between the timeout and taking the lock
            if (!resent)
                return true;

            ++retransmits;
            deadline = deadline_after(timeout_);
        }
    }

    delivery_status deliver()
    {
        while (true)
        {
            // taken before sending so an immediate ack cannot be missed
            uint64_t seen = signal_->generation();

            std::optional<packet> sent = pending_->transmit_front([this](const packet &head)
                                                                  { transmit(head, false); });
            if (!sent)
                return delivery_status::DELIVERED;

            if (!await_acknowledgment(*sent, seen))
                return delivery_status::GAVE_UP;

            acknowledged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

public:
    reliable_sender(std::shared_ptr<i_datagram_socket> socket,
                    std::shared_ptr<pending_queue> pending,
                    duration_ms timeout,
                    uint32_t max_retransmits = 0)
        : socket_(std::move(socket)),
          pending_(std::move(pending)),
          signal_(std::make_shared<ack_signal>()),
          timeout_(timeout),
          max_retransmits_(max_retransmits)
    {
        if (!socket_ || !pending_)
            throw std::invalid_argument("reliable_sender needs a socket and a pending queue");
        if (timeout_ <= duration_ms::zero() || timeout_ > MAX_RETRANSMISSION_TIMEOUT)
            throw std::invalid_argument("retransmission timeout must be positive and at most " +
                                        std::to_string(MAX_RETRANSMISSION_TIMEOUT.count()) + " ms");

        std::optional<packet> head = pending_->front();
        if (!head)
            throw std::invalid_argument("reliable_sender needs at least one pending packet");
        id_ = head->id();
    }

    reliable_sender(const reliable_sender &) = delete;
    reliable_sender &operator=(const reliable_sender &) = delete;

    // blocks until the queue is drained and the listener saw FIN-ACK, or until
    // the sender gave up; send failures propagate as std::system_error
    delivery_status run()
    {
        if (!socket_)
            throw std::logic_error("reliable_sender::run called twice");

        ack_listener listener(id_, pending_, signal_, socket_);
        delivery_status status;
        {
            std::jthread listener_thread([&listener]
                                         { listener.run(); });
            try
            {
                status = deliver();
            }
            catch (const std::system_error &e)
            {
                LOG_ERROR("[reliable_sender " << id_ << "] transport failure: " << e.what());
                socket_->interrupt();
                throw;
            }

            if (status == delivery_status::GAVE_UP)
                socket_->interrupt();

            listener_thread.join();
        }

        // last owner closes the socket
        socket_.reset();

        if (status == delivery_status::DELIVERED)
            LOG_INFO("[i] All packets for id " << id_ << " sent and acknowledged!");
        return status;
    }

    connection_id id() const { return id_; }

    sender_stats stats() const
    {
        sender_stats s;
        s.transmissions = transmissions_.load();
        s.retransmissions = retransmissions_.load();
        s.acknowledged = acknowledged_.load();
        s.spurious_wakeups = spurious_wakeups_.load();
        s.dropped_sends = dropped_sends_.load();
        return s;
    }
};
