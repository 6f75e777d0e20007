#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Argument parsing for file_sender. Numeric parsers throw
// std::invalid_argument or std::out_of_range instead of wrapping.

inline std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split_files(const std::string &list)
{
    std::vector<std::string> files;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trim(item);
        if (!item.empty())
            files.push_back(item);
    }
    return files;
}

// stoul accepts "-1" and wraps it, so the sign is checked first
inline unsigned long parse_unsigned(const std::string &s, unsigned long max, const std::string &what)
{
    std::string t = trim(s);
    if (t.empty() || t[0] == '-' || t[0] == '+')
        throw std::invalid_argument(what + " " + s);

    size_t used = 0;
    unsigned long v = std::stoul(t, &used);
    if (used != t.size())
        throw std::invalid_argument(what + " " + s);
    if (v > max)
        throw std::out_of_range(what + " " + s);
    return v;
}

inline uint16_t parse_port(const std::string &s)
{
    return static_cast<uint16_t>(parse_unsigned(s, UINT16_MAX, "port"));
}

inline uint32_t parse_count(const std::string &s)
{
    return static_cast<uint32_t>(parse_unsigned(s, UINT32_MAX, "count"));
}
