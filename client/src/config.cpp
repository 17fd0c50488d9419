#include "chunkvault/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkvault::client
{

    namespace
    {
        struct CommandArity
        {
            const char *name;
            std::size_t arguments;
        };

        constexpr CommandArity kCommands[] = {
            {"upload", 1},
            {"status", 1},
            {"pause", 1},
            {"resume", 2},
            {"cancel", 1},
        };
    } // namespace

    std::string usage()
    {
        return "Usage: chunkvault_client <host>:<port> --token <TOKEN> [--log <file>] <command>\n"
               "  upload <file> [--chunk-size <bytes>]\n"
               "  status <session>\n"
               "  pause <session>\n"
               "  resume <session> <file>\n"
               "  cancel <session>";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port_string = endpoint.substr(colon_pos + 1);
        config.port = static_cast<std::uint16_t>(std::stoi(port_string));

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--token")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--token requires a value");
                }
                config.token = argv[index++];
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                config.chunk_size = static_cast<std::uint32_t>(std::stoul(argv[index++]));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.command.empty())
            {
                config.command = arg;
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        if (config.token.empty())
        {
            throw std::runtime_error("--token is required");
        }
        if (config.command.empty())
        {
            throw std::runtime_error(usage());
        }
        for (const auto &entry : kCommands)
        {
            if (config.command == entry.name)
            {
                if (config.arguments.size() != entry.arguments)
                {
                    throw std::runtime_error("Wrong number of arguments for " + config.command + "\n" + usage());
                }
                return config;
            }
        }
        throw std::runtime_error("Unknown command: " + config.command);
    }

} // namespace chunkvault::client
