#pragma once

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "../common/logger.hpp"
#include "../common/pending_queue.hpp"
#include "../common/types.hpp"
#include "file_packetizer.hpp"
#include "reliable_sender.hpp"
#include "udp_socket.hpp"

namespace transfer_config
{
    inline constexpr double DEFAULT_TIMEOUT_S = 1.0;
    inline constexpr const char *DEFAULT_BIND_HOST = "0.0.0.0";
    inline constexpr uint16_t EPHEMERAL_PORT = 0;
}

struct transfer_options
{
    std::string dest_host = "127.0.0.1";
    uint16_t dest_port = 0;
    double timeout_s = transfer_config::DEFAULT_TIMEOUT_S;
    std::vector<std::string> files;

    std::string bind_host = transfer_config::DEFAULT_BIND_HOST;
    uint16_t base_port = transfer_config::EPHEMERAL_PORT; // 0: kernel picks, else base_port + file index
    size_t chunk_size = MAX_DATA_SIZE;
    uint32_t max_retransmits = 0; // 0: unbounded
};

enum class file_status
{
    DELIVERED,
    EMPTY,
    OPEN_FAILED,
    BIND_FAILED,
    GAVE_UP,
    TRANSPORT_FAILED,
};

inline const char *to_string(file_status s)
{
    switch (s)
    {
    case file_status::DELIVERED:
        return "delivered";
    case file_status::EMPTY:
        return "empty";
    case file_status::OPEN_FAILED:
        return "open failed";
    case file_status::BIND_FAILED:
        return "bind failed";
    case file_status::GAVE_UP:
        return "gave up";
    case file_status::TRANSPORT_FAILED:
        return "transport failed";
    }
    return "unknown";
}

struct file_outcome
{
    std::string path;
    file_status status = file_status::OPEN_FAILED;
    connection_id id = INVALID_CONNECTION_ID;
    uint16_t local_port = 0;
    size_t packets = 0;
    sender_stats stats;
    std::string error;

    bool ok() const { return status == file_status::DELIVERED || status == file_status::EMPTY; }
};

inline duration_ms timeout_from_seconds(double seconds)
{
    if (!(seconds > 0.0))
        throw std::invalid_argument("timeout must be a positive number of seconds");

    // checked in double before the cast, which is undefined for out-of-range values
    const double max_seconds = std::chrono::duration<double>(MAX_RETRANSMISSION_TIMEOUT).count();
    if (!std::isfinite(seconds) || seconds > max_seconds)
        throw std::invalid_argument("timeout must be at most " + std::to_string(max_seconds) + " seconds");

    auto ms = std::chrono::duration_cast<duration_ms>(std::chrono::duration<double>(seconds));
    return ms.count() > 0 ? ms : duration_ms(1);
}

// One connection per file, all in parallel; run() returns once every sender
// has finished.
class transfer_orchestrator
{
    transfer_options options_;
    duration_ms timeout_;

    struct connection
    {
        size_t index;
        std::unique_ptr<reliable_sender> sender;
    };

    // packets for one file, empty when there is nothing to send
    std::vector<packet> packetize(file_outcome &outcome)
    {
        try
        {
            file_packetizer packetizer(outcome.path, options_.chunk_size);
            outcome.id = packetizer.id();
            std::vector<packet> packets = packetizer.remaining();
            if (packets.empty())
            {
                LOG_WARN("File " << outcome.path << " is empty, nothing to send");
                outcome.status = file_status::EMPTY;
            }
            return packets;
        }
        catch (const file_open_error &e)
        {
            LOG_ERROR(e.what());
            outcome.status = file_status::OPEN_FAILED;
            outcome.error = e.what();
            return {};
        }
        catch (const file_read_error &e)
        {
            // nothing has been sent yet, so a partial file is never announced with FIN
            LOG_ERROR(e.what());
            outcome.status = file_status::OPEN_FAILED;
            outcome.error = e.what();
            return {};
        }
    }

    uint16_t local_port_for(size_t index) const
    {
        if (options_.base_port == transfer_config::EPHEMERAL_PORT)
            return transfer_config::EPHEMERAL_PORT;

        size_t port = options_.base_port + index;
        if (port > UINT16_MAX)
            throw std::system_error(EADDRNOTAVAIL, std::generic_category(),
                                    "port " + std::to_string(port) + " out of range");
        return static_cast<uint16_t>(port);
    }

    std::unique_ptr<reliable_sender> open_connection(size_t index, std::vector<packet> packets,
                                                     file_outcome &outcome)
    {
        std::shared_ptr<udp_socket> socket;
        try
        {
            socket = std::make_shared<udp_socket>(options_.bind_host, local_port_for(index),
                                                  options_.dest_host, options_.dest_port);
        }
        catch (const std::system_error &e)
        {
            LOG_ERROR("Cannot open connection for " << outcome.path << ": " << e.what());
            outcome.status = file_status::BIND_FAILED;
            outcome.error = e.what();
            return nullptr;
        }

        outcome.local_port = socket->local_port();
        outcome.packets = packets.size();

        auto pending = std::make_shared<pending_queue>(packets.begin(), packets.end());
        return std::make_unique<reliable_sender>(std::move(socket), std::move(pending),
                                                 timeout_, options_.max_retransmits);
    }

    static void drive(reliable_sender &sender, file_outcome &outcome)
    {
        try
        {
            delivery_status status = sender.run();
            outcome.status = status == delivery_status::DELIVERED ? file_status::DELIVERED
                                                                  : file_status::GAVE_UP;
        }
        catch (const std::system_error &e)
        {
            outcome.status = file_status::TRANSPORT_FAILED;
            outcome.error = e.what();
        }
        outcome.stats = sender.stats();
    }

public:
    explicit transfer_orchestrator(transfer_options options)
        : options_(std::move(options)), timeout_(timeout_from_seconds(options_.timeout_s))
    {
        if (options_.dest_port == 0)
            throw std::invalid_argument("destination port must be non-zero");
        if (options_.chunk_size == 0 || options_.chunk_size > MAX_DATA_SIZE)
            throw std::invalid_argument("chunk size must be in (0, " + std::to_string(MAX_DATA_SIZE) + "]");
    }

    transfer_orchestrator(const transfer_orchestrator &) = delete;
    transfer_orchestrator &operator=(const transfer_orchestrator &) = delete;

    std::vector<file_outcome> run()
    {
        std::vector<file_outcome> outcomes(options_.files.size());
        std::vector<connection> connections;

        for (size_t i = 0; i < options_.files.size(); ++i)
        {
            outcomes[i].path = options_.files[i];

            std::vector<packet> packets = packetize(outcomes[i]);
            if (packets.empty())
                continue;

            auto sender = open_connection(i, std::move(packets), outcomes[i]);
            if (sender)
                connections.push_back({i, std::move(sender)});
        }

        LOG_INFO("Starting " << connections.size() << " connection(s) to "
                             << options_.dest_host << ":" << options_.dest_port);

        {
            std::vector<std::jthread> senders;
            senders.reserve(connections.size());
            for (auto &c : connections)
            {
                reliable_sender *sender = c.sender.get();
                file_outcome *outcome = &outcomes[c.index];
                senders.emplace_back([sender, outcome]
                                     { drive(*sender, *outcome); });
            }
            // jthread joins on scope exit
        }

        return outcomes;
    }
};
