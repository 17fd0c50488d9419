#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace chunkvault::server
{

    // Extension (lower case, with the leading dot) to content type.
    using ExtensionMap = std::map<std::string, std::string>;

    ExtensionMap default_allowed_extensions();

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> tokens_file;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        std::uint32_t max_token_size{1024};
        std::uint32_t max_chunk_size{100u * 1024u * 1024u};
        std::uint64_t max_file_size{10ULL * 1024 * 1024 * 1024};
        std::chrono::seconds session_idle_timeout{std::chrono::hours{2}};
        std::chrono::seconds terminal_retention{std::chrono::hours{1}};
        std::chrono::seconds sweep_interval{std::chrono::minutes{10}};
        ExtensionMap allowed_extensions{default_allowed_extensions()};
    };

    // Overlays the keys present in a JSON config file onto `config`. Throws on unreadable or invalid files.
    void apply_config_file(const std::filesystem::path &path, ServerConfig &config);

    std::filesystem::path resolve_tokens_path(const ServerConfig &config);

} // namespace chunkvault::server
