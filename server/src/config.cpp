#include "chunkvault/server/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kDefaultTokensFile = "tokens.json";

        std::string normalize_extension(std::string extension)
        {
            std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            if (!extension.empty() && extension.front() != '.')
            {
                extension.insert(extension.begin(), '.');
            }
            return extension;
        }

        std::chrono::seconds seconds_value(const nlohmann::json &json, const char *key, std::chrono::seconds fallback)
        {
            return std::chrono::seconds(json.value(key, static_cast<std::int64_t>(fallback.count())));
        }
    } // namespace

    ExtensionMap default_allowed_extensions()
    {
        return {
            {".mp4", "video/mp4"},
            {".pdf", "application/pdf"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".png", "image/png"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".mov", "video/quicktime"},
            {".avi", "video/x-msvideo"},
            {".mkv", "video/x-matroska"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".m4a", "audio/mp4"},
        };
    }

    void apply_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        const auto json = nlohmann::json::parse(in);
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object: " + path.string());
        }

        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = it->get<std::string>();
        }
        config.worker_threads = json.value("worker_threads", config.worker_threads);
        if (auto it = json.find("tokens_file"); it != json.end())
        {
            config.tokens_file = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("log_file"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        config.log_level = json.value("log_level", config.log_level);
        config.max_token_size = json.value("max_token_size", config.max_token_size);
        config.max_chunk_size = json.value("max_chunk_size", config.max_chunk_size);
        config.max_file_size = json.value("max_file_size", config.max_file_size);
        config.session_idle_timeout = seconds_value(json, "session_idle_timeout_seconds", config.session_idle_timeout);
        config.terminal_retention = seconds_value(json, "terminal_retention_seconds", config.terminal_retention);
        config.sweep_interval = seconds_value(json, "sweep_interval_seconds", config.sweep_interval);

        if (auto it = json.find("allowed_extensions"); it != json.end())
        {
            if (!it->is_object())
            {
                throw std::runtime_error("allowed_extensions must map extensions to content types");
            }
            ExtensionMap extensions;
            for (const auto &[extension, content_type] : it->items())
            {
                extensions[normalize_extension(extension)] = content_type.get<std::string>();
            }
            config.allowed_extensions = std::move(extensions);
        }
    }

    std::filesystem::path resolve_tokens_path(const ServerConfig &config)
    {
        return config.tokens_file.value_or(config.root / kDefaultTokensFile);
    }

} // namespace chunkvault::server
