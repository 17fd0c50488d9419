#include "chunkvault/server/chunk_receiver.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    ChunkReceiver::ChunkReceiver(SessionStore &sessions, const ChunkStaging &staging, Finalizer &finalizer)
        : sessions_(sessions), staging_(staging), finalizer_(finalizer) {}

    ChunkOutcome ChunkReceiver::receive(const Identity &identity, const std::string &session_id,
                                        std::uint32_t chunk_index, std::span<const std::uint8_t> data)
    {
        const auto session = sessions_.find(identity, session_id);
        auto digest = crypto::hash_bytes(data);

        {
            std::lock_guard lock(session->mutex);
            if (is_terminal(session->state))
            {
                throw ProtocolError(ErrorCode::SessionClosed);
            }
            if (chunk_index >= session->total_chunks)
            {
                throw ProtocolError(ErrorCode::ChunkIndexOutOfRange);
            }
            if (data.size() > session->chunk_size)
            {
                throw ProtocolError(ErrorCode::ChunkTooLarge);
            }
            // Any chunk, even a duplicate, shows the client is sending again: Paused becomes Uploading.
            if (!session->apply(SessionEvent::ChunkReceived))
            {
                throw ProtocolError(ErrorCode::InvalidSessionState);
            }

            if (session->has_chunk(chunk_index))
            {
                if (session->chunk_digests[chunk_index] != digest)
                {
                    spdlog::warn("Duplicate chunk {} for session {} differs from the stored copy; keeping the first",
                                 chunk_index, session_id);
                }
                // Every slot is present but no object exists yet: the last commit failed, try again.
                if (!session->all_received() || session->finalizing)
                {
                    spdlog::debug("Duplicate chunk {} for session {}", chunk_index, session_id);
                    return DuplicateChunk{chunk_index, session->received_count};
                }
                spdlog::info("Retrying finalize for session {}", session_id);
            }
            else
            {
                staging_.write(session_id, chunk_index, data);
                session->mark_received(chunk_index, std::move(digest));
                spdlog::debug("Chunk {} stored for session {} ({}/{})", chunk_index, session_id,
                              session->received_count, session->total_chunks);
                if (!session->all_received() || session->finalizing)
                {
                    return ChunkAck{chunk_index, session->received_count, session->total_chunks};
                }
            }
            session->finalizing = true;
        }

        auto result = finalizer_.finalize(*session);
        return UploadCompleted{std::move(result.storage_key), result.final_size};
    }

} // namespace chunkvault::server
