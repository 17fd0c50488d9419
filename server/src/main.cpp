#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/server/config.hpp"
#include "chunkvault/server/server.hpp"
#include "chunkvault/server/token_store.hpp"
#include "chunkvault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkVault server " << chunkvault::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--tokens <FILE>] "
                     "[--config <FILE>] [--log <FILE>]\n"
                  << "       " << program_name
                  << " issue-token --root <ROOT> --user <USER_ID> --name <USERNAME> [--ttl <seconds>] "
                     "[--tokens <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    // Values given on the command line; they win over the config file.
    struct CommandLine
    {
        std::optional<std::uint16_t> port;
        std::optional<std::filesystem::path> root;
        std::optional<std::string> address;
        std::optional<std::size_t> worker_threads;
        std::optional<std::filesystem::path> tokens_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::string> user_id;
        std::optional<std::string> username;
        std::optional<std::chrono::seconds> ttl;
        bool issue_token{false};
        bool help{false};
    };

    std::optional<CommandLine> parse_command_line(int argc, char *argv[])
    {
        CommandLine line;
        int first = 1;
        if (argc > 1 && std::string(argv[1]) == "issue-token")
        {
            line.issue_token = true;
            first = 2;
        }

        for (int i = first; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                line.help = true;
                return line;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }

            if (arg == "--port")
            {
                line.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                line.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                line.address = *value;
            }
            else if (arg == "--threads")
            {
                line.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--tokens")
            {
                line.tokens_file = std::filesystem::path(*value);
            }
            else if (arg == "--config")
            {
                line.config_file = std::filesystem::path(*value);
            }
            else if (arg == "--log")
            {
                line.log_file = std::filesystem::path(*value);
            }
            else if (line.issue_token && arg == "--user")
            {
                line.user_id = *value;
            }
            else if (line.issue_token && arg == "--name")
            {
                line.username = *value;
            }
            else if (line.issue_token && arg == "--ttl")
            {
                line.ttl = std::chrono::seconds(std::stoll(*value));
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return std::nullopt;
            }
        }
        return line;
    }

    chunkvault::server::ServerConfig build_config(const CommandLine &line)
    {
        chunkvault::server::ServerConfig config;
        if (line.config_file)
        {
            chunkvault::server::apply_config_file(*line.config_file, config);
        }
        if (line.port)
        {
            config.port = *line.port;
        }
        if (line.root)
        {
            config.root = *line.root;
        }
        if (line.address)
        {
            config.address = *line.address;
        }
        if (line.worker_threads)
        {
            config.worker_threads = *line.worker_threads;
        }
        if (line.tokens_file)
        {
            config.tokens_file = line.tokens_file;
        }
        if (line.log_file)
        {
            config.log_file = line.log_file;
        }
        return config;
    }

    void setup_logging(const chunkvault::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    int issue_token(const CommandLine &line, const chunkvault::server::ServerConfig &config)
    {
        if (config.root.empty() || !line.user_id || line.user_id->empty())
        {
            std::cerr << "issue-token requires --root and --user" << std::endl;
            return EXIT_FAILURE;
        }
        std::filesystem::create_directories(config.root);
        chunkvault::server::TokenStore tokens(chunkvault::server::resolve_tokens_path(config));
        const auto username = line.username.value_or(*line.user_id);
        const auto token = tokens.issue(*line.user_id, username, line.ttl);
        spdlog::info("Issued token for {} ({}) in {}", username, *line.user_id, tokens.database_path().string());
        std::cout << token << std::endl;
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    const auto line = parse_command_line(argc, argv);
    if (!line)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (line->help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        auto config = build_config(*line);
        setup_logging(config);

        if (line->issue_token)
        {
            return issue_token(*line, config);
        }

        if (config.port == 0 || config.root.empty())
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        spdlog::info("Starting ChunkVault server {} on {}:{}", chunkvault::version(), config.address, config.port);
        chunkvault::server::Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
