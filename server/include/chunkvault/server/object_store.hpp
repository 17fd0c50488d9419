#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace chunkvault::server
{

    class StorageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CommitResult
    {
        std::string key;
        std::uint64_t size{};
    };

    // Destination for assembled uploads.
    class ObjectStore
    {
    public:
        virtual ~ObjectStore() = default;

        // Consumes `stream` to EOF. Throws StorageError.
        virtual CommitResult commit(std::istream &stream, const std::string &suggested_name,
                                    const std::string &content_type) = 0;
    };

    // Objects live under <root>/objects/<key> with a <key>.meta.json sidecar.
    class FilesystemObjectStore : public ObjectStore
    {
    public:
        explicit FilesystemObjectStore(std::filesystem::path root);

        CommitResult commit(std::istream &stream, const std::string &suggested_name,
                            const std::string &content_type) override;

        std::filesystem::path objects_root() const;

        // Resolves a committed key to its object path; throws StorageError on traversal.
        std::filesystem::path object_path(const std::string &key) const;

    private:
        std::filesystem::path sanitize(const std::string &key) const;
        std::string reserve_key_locked(const std::string &suggested_name) const;

        std::filesystem::path objects_;
        std::mutex mutex_;
    };

} // namespace chunkvault::server
