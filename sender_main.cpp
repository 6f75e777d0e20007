#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "common/logger.hpp"
#include "sender/cli_args.hpp"
#include "sender/transfer_orchestrator.hpp"

static void usage(const char *prog)
{
    std::cerr << "usage: " << prog << " [-v|-vv] [--bind HOST] [--base-port N] [--chunk-size N]"
              << " [--max-retransmits N] <dest_ip> <dest_port> <timeout_s> <file[,file...]>\n"
              << "missing positional arguments are prompted for.\n";
}

static std::string prompt(const std::string &question)
{
    std::cout << question << std::flush;
    std::string line;
    if (!std::getline(std::cin, line))
        throw std::runtime_error("no input for: " + question);
    return trim(line);
}

int main(int argc, char *argv[])
{
    transfer_options options;
    std::vector<std::string> positional;
    int verbosity = 0;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help")
            {
                usage(argv[0]);
                return 0;
            }
            else if (arg == "-v")
                verbosity = 1;
            else if (arg == "-vv")
                verbosity = 2;
            else if (arg == "--bind")
                options.bind_host = value();
            else if (arg == "--base-port")
                options.base_port = parse_port(value());
            else if (arg == "--chunk-size")
                options.chunk_size = parse_unsigned(value(), MAX_DATA_SIZE, "chunk size");
            else if (arg == "--max-retransmits")
                options.max_retransmits = parse_count(value());
            else
                positional.push_back(arg);
        }

        if (positional.size() > 4)
            throw std::invalid_argument("too many arguments");

        options.dest_host = positional.size() > 0 ? positional[0] : prompt("Enter destination (IP): ");
        options.dest_port = parse_port(positional.size() > 1 ? positional[1] : prompt("Enter destination (Port): "));
        options.timeout_s = std::stod(positional.size() > 2 ? positional[2] : prompt("Timeout (s): "));
        options.files = split_files(positional.size() > 3 ? positional[3]
                                                          : prompt("Files to send (Separated by comma): "));
    }
    catch (const std::exception &e)
    {
        std::cerr << "bad arguments: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    logger::getInstance().setVerbosity(verbosity);

    if (options.files.empty())
    {
        std::cerr << "no files to send\n";
        return 2;
    }

    std::vector<file_outcome> outcomes;
    try
    {
        transfer_orchestrator orchestrator(options);
        outcomes = orchestrator.run();
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "bad arguments: " << e.what() << "\n";
        return 2;
    }
    catch (const std::system_error &e)
    {
        LOG_CRITICAL("transfer aborted: " << e.what());
        return 1;
    }

    bool all_ok = true;
    for (const auto &o : outcomes)
    {
        std::cout << std::left << std::setw(32) << o.path << " " << to_string(o.status);
        if (o.status == file_status::DELIVERED || o.status == file_status::GAVE_UP)
            std::cout << " (id " << o.id << ", port " << o.local_port << ", " << o.packets
                      << " packets, " << o.stats.retransmissions << " retransmissions)";
        if (!o.error.empty())
            std::cout << ": " << o.error;
        std::cout << "\n";
        all_ok = all_ok && o.ok();
    }

    return all_ok ? 0 : 1;
}
