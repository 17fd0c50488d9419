#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    UploadSession::UploadSession(std::string id, Identity owner_identity, std::string file_name,
                                 std::string file_extension, std::string mime_type, std::string key,
                                 std::uint32_t chunks, std::uint32_t bytes_per_chunk)
        : session_id(std::move(id)),
          owner(std::move(owner_identity)),
          filename(std::move(file_name)),
          extension(std::move(file_extension)),
          content_type(std::move(mime_type)),
          storage_key(std::move(key)),
          total_chunks(chunks),
          chunk_size(bytes_per_chunk),
          created_at(std::chrono::system_clock::now()),
          received(chunks, false),
          chunk_digests(chunks),
          updated_at(created_at)
    {
    }

    bool UploadSession::apply(SessionEvent event)
    {
        const auto next = transition(state, event);
        if (!next)
        {
            return false;
        }
        const auto now = std::chrono::system_clock::now();
        if (*next == UploadState::Paused)
        {
            if (state != UploadState::Paused)
            {
                paused_at = now;
            }
        }
        else
        {
            paused_at.reset();
        }
        state = *next;
        updated_at = now;
        return true;
    }

    bool UploadSession::has_chunk(std::uint32_t index) const noexcept
    {
        return index < received.size() && received[index];
    }

    void UploadSession::mark_received(std::uint32_t index, std::string digest)
    {
        if (index >= total_chunks || received[index])
        {
            return;
        }
        received[index] = true;
        chunk_digests[index] = std::move(digest);
        ++received_count;
        updated_at = std::chrono::system_clock::now();
    }

    std::vector<std::uint32_t> UploadSession::missing_chunks() const
    {
        std::vector<std::uint32_t> missing;
        missing.reserve(total_chunks - received_count);
        for (std::uint32_t i = 0; i < total_chunks; ++i)
        {
            if (!received[i])
            {
                missing.push_back(i);
            }
        }
        return missing;
    }

} // namespace chunkvault::server
