#include "chunkvault/server/object_store.hpp"

#include <array>
#include <chrono>
#include <fstream>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kObjectsDir = "objects";
        constexpr auto kMetaSuffix = ".meta.json";
        constexpr auto kPartSuffix = ".part";
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        std::filesystem::path with_suffix(std::filesystem::path path, const char *suffix)
        {
            path += suffix;
            return path;
        }

        std::int64_t unix_now()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    } // namespace

    FilesystemObjectStore::FilesystemObjectStore(std::filesystem::path root) : objects_(std::move(root) / kObjectsDir)
    {
        std::filesystem::create_directories(objects_);
    }

    std::filesystem::path FilesystemObjectStore::objects_root() const
    {
        return objects_;
    }

    std::filesystem::path FilesystemObjectStore::object_path(const std::string &key) const
    {
        return sanitize(key);
    }

    std::filesystem::path FilesystemObjectStore::sanitize(const std::string &key) const
    {
        const std::filesystem::path relative = key;
        if (key.empty() || relative.is_absolute())
        {
            throw StorageError("Invalid storage key: " + key);
        }

        std::filesystem::path sanitized = objects_;
        bool has_name = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw StorageError("Path traversal detected in storage key: " + key);
            }
            sanitized /= part;
            has_name = true;
        }
        if (!has_name)
        {
            throw StorageError("Invalid storage key: " + key);
        }
        return sanitized;
    }

    std::string FilesystemObjectStore::reserve_key_locked(const std::string &suggested_name) const
    {
        const auto first = sanitize(suggested_name);
        std::error_code ec;
        if (!std::filesystem::exists(first, ec))
        {
            return suggested_name;
        }

        // Same key committed twice within a second: append a counter before the extension.
        const std::filesystem::path suggested = suggested_name;
        const auto stem = suggested.stem().string();
        const auto extension = suggested.extension().string();
        for (unsigned attempt = 1;; ++attempt)
        {
            auto candidate = (suggested.parent_path() / (stem + "_" + std::to_string(attempt) + extension))
                                 .generic_string();
            if (!std::filesystem::exists(sanitize(candidate), ec))
            {
                return candidate;
            }
        }
    }

    CommitResult FilesystemObjectStore::commit(std::istream &stream, const std::string &suggested_name,
                                               const std::string &content_type)
    {
        std::string key;
        std::filesystem::path target;
        std::filesystem::path temp;
        {
            std::lock_guard lock(mutex_);
            key = reserve_key_locked(suggested_name);
            target = sanitize(key);
            temp = with_suffix(target, kPartSuffix);

            std::error_code ec;
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw StorageError("Failed to create object directory: " + ec.message());
            }
            // Claim the name so a concurrent commit of the same key picks a suffix.
            std::ofstream claim(target, std::ios::binary | std::ios::trunc);
            if (!claim.is_open())
            {
                throw StorageError("Failed to create object: " + target.string());
            }
        }

        auto discard = [&]()
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            std::filesystem::remove(target, ignored);
        };

        crypto::Digest digest;

        std::uint64_t size = 0;
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                discard();
                throw StorageError("Failed to open temporary object file: " + temp.string());
            }

            std::array<char, kCopyBufferSize> buffer{};
            while (stream)
            {
                stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = stream.gcount();
                if (count <= 0)
                {
                    break;
                }
                out.write(buffer.data(), count);
                digest.update(std::string_view(buffer.data(), static_cast<std::size_t>(count)));
                size += static_cast<std::uint64_t>(count);
            }
            if (stream.bad())
            {
                discard();
                throw StorageError("Failed to read upload stream");
            }
            out.flush();
            if (!out)
            {
                discard();
                throw StorageError("Failed to write object: " + temp.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            discard();
            throw StorageError("Failed to move object into place: " + ec.message());
        }

        nlohmann::json meta{
            {"key", key},
            {"size", size},
            {"content_type", content_type},
            {"blake2b", digest.hex()},
            {"committed_at", unix_now()},
        };
        const auto meta_path = with_suffix(target, kMetaSuffix);
        std::ofstream meta_out(meta_path, std::ios::trunc);
        if (!meta_out.is_open())
        {
            discard();
            throw StorageError("Failed to write object metadata: " + meta_path.string());
        }
        meta_out << meta.dump(4);
        if (!meta_out)
        {
            discard();
            throw StorageError("Failed to write object metadata: " + meta_path.string());
        }

        spdlog::info("Stored object {} ({} bytes, {})", key, size, content_type);
        return CommitResult{key, size};
    }

} // namespace chunkvault::server
