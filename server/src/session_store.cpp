#include "chunkvault/server/session_store.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::size_t kSessionIdRandomBytes = 8;
        // Longest name most filesystems accept for one path component.
        constexpr std::size_t kMaxFilenameLength = 255;
        // READY and COMPLETE carry the key behind a 16-bit length.
        constexpr std::size_t kMaxStorageKeyLength = std::numeric_limits<std::uint16_t>::max();

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        // <user_id>/<YYYYMMDD_HHMMSS>/<filename>, UTC.
        std::string make_storage_key(const std::string &user_id, const std::string &filename,
                                     std::chrono::system_clock::time_point when)
        {
            const auto seconds = std::chrono::system_clock::to_time_t(when);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream oss;
            oss << user_id << '/' << std::put_time(&utc, "%Y%m%d_%H%M%S") << '/' << filename;
            return oss.str();
        }

        SessionProgress progress_of(const UploadSession &session)
        {
            return SessionProgress{
                .state = session.state,
                .received_count = session.received_count,
                .total_chunks = session.total_chunks,
            };
        }

        // Shared checks for commands that address an existing session; caller holds the session mutex.
        void require_open(const UploadSession &session)
        {
            if (session.state == UploadState::Cancelled)
            {
                throw ProtocolError(ErrorCode::SessionNotFound);
            }
            if (session.state == UploadState::Complete)
            {
                throw ProtocolError(ErrorCode::SessionClosed);
            }
        }
    } // namespace

    SessionPolicy make_session_policy(const ServerConfig &config)
    {
        return SessionPolicy{
            .allowed_extensions = config.allowed_extensions,
            .max_chunk_size = config.max_chunk_size,
            .max_file_size = config.max_file_size,
            .idle_timeout = config.session_idle_timeout,
            .terminal_retention = config.terminal_retention,
        };
    }

    SessionStore::SessionStore(SessionPolicy policy, const ChunkStaging &staging)
        : policy_(std::move(policy)), staging_(staging) {}

    InitResult SessionStore::init(const Identity &identity, const std::string &filename, std::uint32_t total_chunks,
                                  std::uint32_t chunk_size)
    {
        // Only the final path component is kept; it names the stored object.
        const auto base_name = std::filesystem::path(filename).filename().string();
        const auto extension = lower(std::filesystem::path(base_name).extension().string());
        if (base_name.size() > kMaxFilenameLength)
        {
            throw ProtocolError(ErrorCode::InvalidFilename);
        }
        const auto allowed = policy_.allowed_extensions.find(extension);
        if (base_name.empty() || extension.empty() || allowed == policy_.allowed_extensions.end())
        {
            throw ProtocolError(ErrorCode::UnsupportedFileType);
        }
        if (total_chunks == 0 || chunk_size == 0 || chunk_size > policy_.max_chunk_size)
        {
            throw ProtocolError(ErrorCode::InvalidChunkParameters);
        }
        if (static_cast<std::uint64_t>(total_chunks) * chunk_size > policy_.max_file_size)
        {
            throw ProtocolError(ErrorCode::FileTooLarge);
        }

        const auto now = std::chrono::system_clock::now();
        std::shared_ptr<UploadSession> session;
        {
            std::unique_lock lock(mutex_);
            auto session_id = generate_session_id_locked(identity.user_id);
            auto storage_key = make_storage_key(identity.user_id, base_name, now);
            if (storage_key.size() > kMaxStorageKeyLength || session_id.size() > kMaxStorageKeyLength)
            {
                throw ProtocolError(ErrorCode::InvalidFilename);
            }
            session = std::make_shared<UploadSession>(session_id, identity, base_name, extension, allowed->second,
                                                      std::move(storage_key), total_chunks, chunk_size);
            sessions_.emplace(std::move(session_id), session);
        }

        spdlog::info("Created session {} (user {}, file {}, chunks {}, chunk size {}, key {})", session->session_id,
                     identity.username, base_name, total_chunks, chunk_size, session->storage_key);
        return InitResult{session->session_id, session->storage_key};
    }

    SessionProgress SessionStore::pause(const Identity &identity, const std::string &session_id)
    {
        const auto session = find(identity, session_id);
        std::lock_guard lock(session->mutex);
        require_open(*session);
        if (!session->apply(SessionEvent::Pause))
        {
            throw ProtocolError(ErrorCode::InvalidSessionState, "session cannot be paused");
        }
        spdlog::info("Upload paused: session={} progress={}/{}", session_id, session->received_count,
                     session->total_chunks);
        return progress_of(*session);
    }

    ResumeResult SessionStore::resume(const Identity &identity, const std::string &session_id)
    {
        const auto session = find(identity, session_id);
        std::lock_guard lock(session->mutex);
        require_open(*session);
        if (!session->apply(SessionEvent::Resume))
        {
            throw ProtocolError(ErrorCode::InvalidSessionState, "session not resumable");
        }
        ResumeResult result{
            .progress = progress_of(*session),
            .missing_chunks = session->missing_chunks(),
        };
        spdlog::info("Upload resumed: session={} progress={}/{} missing={}", session_id,
                     result.progress.received_count, result.progress.total_chunks, result.missing_chunks.size());
        return result;
    }

    void SessionStore::cancel(const Identity &identity, const std::string &session_id)
    {
        const auto session = find(identity, session_id);
        bool release_now = false;
        {
            std::lock_guard lock(session->mutex);
            require_open(*session);
            if (!session->apply(SessionEvent::Cancel))
            {
                throw ProtocolError(ErrorCode::InvalidSessionState, "session cannot be cancelled");
            }
            // An in-flight finalize still reads the slots; it releases them when it returns.
            release_now = !session->finalizing;
        }
        if (release_now)
        {
            staging_.release(session_id);
        }
        forget(session);
        spdlog::info("Upload cancelled: session={}", session_id);
    }

    SessionProgress SessionStore::status(const Identity &identity, const std::string &session_id) const
    {
        const auto session = find(identity, session_id);
        std::lock_guard lock(session->mutex);
        if (session->state == UploadState::Cancelled)
        {
            throw ProtocolError(ErrorCode::SessionNotFound);
        }
        return progress_of(*session);
    }

    std::shared_ptr<UploadSession> SessionStore::find(const Identity &identity, const std::string &session_id) const
    {
        std::shared_lock lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second->owner.user_id != identity.user_id)
        {
            throw ProtocolError(ErrorCode::SessionNotFound);
        }
        return it->second;
    }

    std::size_t SessionStore::sweep(std::chrono::system_clock::time_point now)
    {
        std::vector<std::shared_ptr<UploadSession>> evicted;
        {
            std::unique_lock lock(mutex_);
            for (auto it = sessions_.begin(); it != sessions_.end();)
            {
                auto &session = it->second;
                // A session busy with a chunk write is active anyway; look at it on the next pass.
                std::unique_lock session_lock(session->mutex, std::try_to_lock);
                if (!session_lock.owns_lock())
                {
                    ++it;
                    continue;
                }
                const auto idle = now - session->updated_at;
                bool evict = false;
                if (session->finalizing)
                {
                    evict = false;
                }
                else if (is_terminal(session->state))
                {
                    evict = idle > policy_.terminal_retention;
                }
                else if (idle > policy_.idle_timeout)
                {
                    session->apply(SessionEvent::Cancel);
                    evict = true;
                }

                if (evict)
                {
                    spdlog::info("Evicting session {} (state {}, age {}s)", session->session_id,
                                 to_string(session->state),
                                 std::chrono::duration_cast<std::chrono::seconds>(now - session->created_at).count());
                    evicted.push_back(session);
                    it = sessions_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (const auto &session : evicted)
        {
            staging_.release(session->session_id);
        }
        return evicted.size();
    }

    std::size_t SessionStore::size() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    std::string SessionStore::generate_session_id_locked(const std::string &user_id) const
    {
        for (;;)
        {
            auto candidate = user_id + "_" + crypto::random_hex(kSessionIdRandomBytes);
            if (!sessions_.contains(candidate))
            {
                return candidate;
            }
        }
    }

    void SessionStore::forget(const std::shared_ptr<UploadSession> &session)
    {
        std::unique_lock lock(mutex_);
        const auto it = sessions_.find(session->session_id);
        if (it != sessions_.end() && it->second == session)
        {
            sessions_.erase(it);
        }
    }

} // namespace chunkvault::server
