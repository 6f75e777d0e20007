#pragma once

#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

enum class packet_type : uint8_t
{
    DATA = 0,
    FIN = 1,
    ACK = 2,
    FIN_ACK = 3,
};

inline const char *to_string(packet_type t)
{
    switch (t)
    {
    case packet_type::DATA:
        return "DATA";
    case packet_type::FIN:
        return "FIN";
    case packet_type::ACK:
        return "ACK";
    case packet_type::FIN_ACK:
        return "FIN-ACK";
    }
    return "UNKNOWN";
}

/*
 * wire layout, network byte order
 *
 *   0      1          5          9          13
 *   +------+----------+----------+----------+-----------------+
 *   | type |  conn id |   seq    |  length  | payload[length] |
 *   +------+----------+----------+----------+-----------------+
 */
class packet
{
    packet_type type_ = packet_type::DATA;
    connection_id id_ = INVALID_CONNECTION_ID;
    sequence_number seq_ = 0;
    std::vector<char> payload_;

public:
    static constexpr size_t HEADER_SIZE = 13;

    static_assert(MAX_DATA_SIZE + HEADER_SIZE <= MAX_PACKET_SIZE,
                  "payload plus header must fit in one datagram");

    packet() = default;

    packet(packet_type type, connection_id id, sequence_number seq,
           std::vector<char> payload = {})
        : type_(type), id_(id), seq_(seq), payload_(std::move(payload))
    {
        if (payload_.size() > MAX_DATA_SIZE)
            throw std::length_error("packet payload of " + std::to_string(payload_.size()) +
                                    " bytes exceeds " + std::to_string(MAX_DATA_SIZE));
    }

    packet_type type() const { return type_; }
    connection_id id() const { return id_; }
    sequence_number seq() const { return seq_; }
    uint32_t length() const { return static_cast<uint32_t>(payload_.size()); }
    const std::vector<char> &payload() const { return payload_; }

    bool is_acknowledgment() const
    {
        return type_ == packet_type::ACK || type_ == packet_type::FIN_ACK;
    }

    // ACK for DATA, FIN-ACK for FIN, mirroring id and seq
    static packet acknowledgment_for(const packet &p)
    {
        packet_type t = p.type() == packet_type::FIN ? packet_type::FIN_ACK : packet_type::ACK;
        return packet(t, p.id(), p.seq());
    }

    bool acknowledges(const packet &pending) const
    {
        return is_acknowledgment() && !pending.is_acknowledgment() &&
               id_ == pending.id_ && seq_ == pending.seq_;
    }

    std::vector<char> encode() const
    {
        std::vector<char> out(HEADER_SIZE + payload_.size());

        uint32_t id = htonl(id_);
        uint32_t seq = htonl(seq_);
        uint32_t len = htonl(length());

        out[0] = static_cast<char>(type_);
        memcpy(out.data() + 1, &id, 4);
        memcpy(out.data() + 5, &seq, 4);
        memcpy(out.data() + 9, &len, 4);
        if (!payload_.empty())
            memcpy(out.data() + HEADER_SIZE, payload_.data(), payload_.size());
        return out;
    }

    // empty for anything that is not a well formed packet
    static std::optional<packet> decode(const char *buf, size_t len)
    {
        if (buf == nullptr || len < HEADER_SIZE)
            return std::nullopt;

        uint8_t raw_type = static_cast<uint8_t>(buf[0]);
        if (raw_type > static_cast<uint8_t>(packet_type::FIN_ACK))
            return std::nullopt;

        uint32_t id, seq, payload_len;
        memcpy(&id, buf + 1, 4);
        memcpy(&seq, buf + 5, 4);
        memcpy(&payload_len, buf + 9, 4);
        payload_len = ntohl(payload_len);

        if (payload_len > MAX_DATA_SIZE || payload_len != len - HEADER_SIZE)
            return std::nullopt;

        return packet(static_cast<packet_type>(raw_type), ntohl(id), ntohl(seq),
                      std::vector<char>(buf + HEADER_SIZE, buf + len));
    }

    bool operator==(const packet &other) const
    {
        return type_ == other.type_ && id_ == other.id_ && seq_ == other.seq_ &&
               payload_ == other.payload_;
    }

    bool operator!=(const packet &other) const { return !(*this == other); }
};

inline std::ostream &operator<<(std::ostream &os, const packet &p)
{
    return os << to_string(p.type()) << "(id=" << p.id() << ", seq=" << p.seq()
              << ", len=" << p.length() << ")";
}
