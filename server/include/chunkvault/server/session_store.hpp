#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/server/auth_gate.hpp"
#include "chunkvault/server/chunk_staging.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    struct SessionPolicy
    {
        ExtensionMap allowed_extensions{default_allowed_extensions()};
        std::uint32_t max_chunk_size{100u * 1024u * 1024u};
        std::uint64_t max_file_size{10ULL * 1024 * 1024 * 1024};
        std::chrono::seconds idle_timeout{std::chrono::hours{2}};
        std::chrono::seconds terminal_retention{std::chrono::hours{1}};
    };

    SessionPolicy make_session_policy(const ServerConfig &config);

    struct InitResult
    {
        std::string session_id;
        std::string storage_key;
    };

    struct SessionProgress
    {
        UploadState state{UploadState::Initialized};
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
    };

    struct ResumeResult
    {
        SessionProgress progress;
        std::vector<std::uint32_t> missing_chunks;
    };

    // Registry of live upload sessions. The registry lock only guards the map;
    // each session's mutable fields are guarded by its own mutex, so unrelated
    // sessions never wait on each other. Every operation throws ProtocolError.
    class SessionStore
    {
    public:
        SessionStore(SessionPolicy policy, const ChunkStaging &staging);

        InitResult init(const Identity &identity, const std::string &filename, std::uint32_t total_chunks,
                        std::uint32_t chunk_size);

        SessionProgress pause(const Identity &identity, const std::string &session_id);

        ResumeResult resume(const Identity &identity, const std::string &session_id);

        // Cancelled sessions are forgotten: later lookups report SessionNotFound.
        void cancel(const Identity &identity, const std::string &session_id);

        SessionProgress status(const Identity &identity, const std::string &session_id) const;

        // Sessions owned by another identity are reported as not found.
        std::shared_ptr<UploadSession> find(const Identity &identity, const std::string &session_id) const;

        // Evicts terminal sessions past the retention window and idle sessions past the idle timeout.
        std::size_t sweep(std::chrono::system_clock::time_point now);

        std::size_t size() const;

    private:
        std::string generate_session_id_locked(const std::string &user_id) const;
        void forget(const std::shared_ptr<UploadSession> &session);

        SessionPolicy policy_;
        const ChunkStaging &staging_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
    };

} // namespace chunkvault::server
