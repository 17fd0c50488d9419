#include "chunkvault/server/token_store.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::size_t kTokenBytes = 24;

        std::int64_t unix_now()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        std::int64_t expiry_from(std::optional<std::chrono::seconds> lifetime)
        {
            return lifetime ? unix_now() + lifetime->count() : 0;
        }
    } // namespace

    TokenStore::TokenStore(std::filesystem::path database_path) : database_path_(std::move(database_path))
    {
        if (database_path_.has_parent_path())
        {
            std::filesystem::create_directories(database_path_.parent_path());
        }
    }

    std::filesystem::path TokenStore::database_path() const
    {
        return database_path_;
    }

    std::optional<Identity> TokenStore::resolve(std::string_view token) const
    {
        const auto digest = crypto::hash_text(token);
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = tokens_.find(digest);
        if (it == tokens_.end())
        {
            return std::nullopt;
        }
        if (it->second.expires_at != 0 && unix_now() > it->second.expires_at)
        {
            return std::nullopt;
        }
        return Identity{it->second.user_id, it->second.username};
    }

    std::string TokenStore::issue(const std::string &user_id, const std::string &username,
                                  std::optional<std::chrono::seconds> lifetime)
    {
        auto token = crypto::random_hex(kTokenBytes);
        add(token, user_id, username, lifetime);
        return token;
    }

    void TokenStore::add(std::string_view token, const std::string &user_id, const std::string &username,
                         std::optional<std::chrono::seconds> lifetime)
    {
        if (token.empty() || user_id.empty())
        {
            throw std::invalid_argument("token and user id are required");
        }
        const auto digest = crypto::hash_text(token);
        std::lock_guard lock(mutex_);
        load_locked();
        tokens_[digest] = Entry{user_id, username, expiry_from(lifetime)};
        persist_locked();
        spdlog::info("Added auth token for user {} ({})", username, user_id);
    }

    bool TokenStore::revoke(std::string_view token)
    {
        const auto digest = crypto::hash_text(token);
        std::lock_guard lock(mutex_);
        load_locked();
        if (tokens_.erase(digest) == 0)
        {
            return false;
        }
        persist_locked();
        return true;
    }

    void TokenStore::load_locked() const
    {
        const auto stamp = current_stamp();
        if (loaded_stamp_ && *loaded_stamp_ == stamp)
        {
            return;
        }
        tokens_.clear();
        if (std::filesystem::exists(database_path_))
        {
            std::ifstream in(database_path_);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open token database: " + database_path_.string());
            }
            nlohmann::json json;
            in >> json;
            if (json.is_object())
            {
                for (const auto &[digest, value] : json.items())
                {
                    tokens_[digest] = Entry{
                        value.at("user_id").get<std::string>(),
                        value.value("username", std::string{}),
                        value.value("expires_at", std::int64_t{0}),
                    };
                }
            }
        }
        loaded_stamp_ = stamp;
    }

    void TokenStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[digest, entry] : tokens_)
        {
            json[digest] = {
                {"user_id", entry.user_id},
                {"username", entry.username},
                {"expires_at", entry.expires_at},
            };
        }
        std::ofstream out(database_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write token database: " + database_path_.string());
        }
        out << json.dump(2);
        out.close();
        loaded_stamp_ = current_stamp();
    }

    TokenStore::FileStamp TokenStore::current_stamp() const
    {
        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(database_path_, ec);
        if (ec)
        {
            return {std::filesystem::file_time_type::min(), 0};
        }
        const auto size = std::filesystem::file_size(database_path_, ec);
        return {modified, ec ? 0 : size};
    }

} // namespace chunkvault::server
