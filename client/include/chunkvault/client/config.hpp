#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::client
{

    inline constexpr std::uint32_t kDefaultChunkSize = 1024 * 1024;

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::string token;
        std::optional<std::filesystem::path> log_path;
        std::uint32_t chunk_size{kDefaultChunkSize};
        std::string command;
        std::vector<std::string> arguments;
    };

    // <host>:<port> --token <T> [--log <file>] <command> [args...] [--chunk-size <N>]
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace chunkvault::client
