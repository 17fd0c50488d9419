#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "chunkvault/server/auth_gate.hpp"

namespace chunkvault::server
{

    // JSON-backed token database. Tokens are stored as BLAKE2b digests, never in plain text.
    class TokenStore : public Authenticator
    {
    public:
        explicit TokenStore(std::filesystem::path database_path);

        std::optional<Identity> resolve(std::string_view token) const override;

        // Mints a random token; the plain token is only ever returned here.
        std::string issue(const std::string &user_id, const std::string &username,
                          std::optional<std::chrono::seconds> lifetime);

        void add(std::string_view token, const std::string &user_id, const std::string &username,
                 std::optional<std::chrono::seconds> lifetime);

        bool revoke(std::string_view token);

        std::filesystem::path database_path() const;

    private:
        struct Entry
        {
            std::string user_id;
            std::string username;
            std::int64_t expires_at{0};
        };

        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        // Modification time and size of the database when it was last read; a changed file is re-read.
        using FileStamp = std::pair<std::filesystem::file_time_type, std::uintmax_t>;

        FileStamp current_stamp() const;

        mutable std::optional<FileStamp> loaded_stamp_;
        mutable std::unordered_map<std::string, Entry> tokens_;
    };

} // namespace chunkvault::server
