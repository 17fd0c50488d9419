#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include "chunkvault/server/auth_gate.hpp"
#include "chunkvault/server/chunk_staging.hpp"
#include "chunkvault/server/finalizer.hpp"
#include "chunkvault/server/session_store.hpp"

namespace chunkvault::server
{

    struct ChunkAck
    {
        std::uint32_t chunk_index{};
        std::uint32_t received_count{};
        std::uint32_t total_chunks{};
    };

    struct DuplicateChunk
    {
        std::uint32_t chunk_index{};
        std::uint32_t received_count{};
    };

    struct UploadCompleted
    {
        std::string storage_key;
        std::uint64_t final_size{};
    };

    using ChunkOutcome = std::variant<ChunkAck, DuplicateChunk, UploadCompleted>;

    class ChunkReceiver
    {
    public:
        ChunkReceiver(SessionStore &sessions, const ChunkStaging &staging, Finalizer &finalizer);

        // Stores one chunk. The write, the receipt update and the completion check happen under the
        // session mutex; the chunk that completes the set runs the finalizer before returning.
        ChunkOutcome receive(const Identity &identity, const std::string &session_id, std::uint32_t chunk_index,
                             std::span<const std::uint8_t> data);

    private:
        SessionStore &sessions_;
        const ChunkStaging &staging_;
        Finalizer &finalizer_;
    };

} // namespace chunkvault::server
