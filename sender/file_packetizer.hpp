#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../common/packet.hpp"
#include "../common/types.hpp"

class file_open_error : public std::runtime_error
{
public:
    explicit file_open_error(const std::string &path)
        : std::runtime_error("File " + path + " doesn't exist") {}

    file_open_error(const std::string &path, const std::string &reason)
        : std::runtime_error("File " + path + " " + reason) {}
};

class file_read_error : public std::runtime_error
{
public:
    explicit file_read_error(const std::string &path)
        : std::runtime_error("File " + path + " could not be read to the end") {}
};

// Lazily turns a file into DATA, DATA, ..., FIN packets under one connection
// id. Reads one chunk ahead so the last chunk can be tagged FIN.
class file_packetizer
{
    std::string path_;
    std::ifstream in_;
    size_t chunk_size_;
    connection_id id_;
    sequence_number next_seq_ = 0;
    std::vector<char> lookahead_;

    std::vector<char> read_chunk()
    {
        std::vector<char> chunk(chunk_size_);
        in_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        // eof and fail are a short last chunk, bad is a real I/O error
        if (in_.bad())
            throw file_read_error(path_);
        chunk.resize(static_cast<size_t>(in_.gcount()));
        return chunk;
    }

public:
    explicit file_packetizer(const std::string &path,
                             size_t chunk_size = MAX_DATA_SIZE,
                             connection_id id = get_random_connection_id())
        : path_(path), chunk_size_(chunk_size), id_(id)
    {
        if (chunk_size_ == 0 || chunk_size_ > MAX_DATA_SIZE)
            throw std::invalid_argument("chunk size must be in (0, " + std::to_string(MAX_DATA_SIZE) + "]");

        // a directory opens fine as an ifstream and then reads as empty
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !std::filesystem::is_regular_file(path, ec))
            throw file_open_error(path, "is not a regular file");

        in_.open(path, std::ios::binary);
        if (!in_)
            throw file_open_error(path);

        lookahead_ = read_chunk();
    }

    connection_id id() const { return id_; }

    std::optional<packet> next()
    {
        if (lookahead_.empty())
            return std::nullopt;

        std::vector<char> chunk = std::move(lookahead_);
        lookahead_ = read_chunk();

        packet_type type = lookahead_.empty() ? packet_type::FIN : packet_type::DATA;
        return packet(type, id_, next_seq_++, std::move(chunk));
    }

    std::vector<packet> remaining()
    {
        std::vector<packet> out;
        while (auto p = next())
            out.push_back(std::move(*p));
        return out;
    }
};
