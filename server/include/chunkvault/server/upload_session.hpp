#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/server/auth_gate.hpp"
#include "chunkvault/server/session_state.hpp"

namespace chunkvault::server
{

    // One upload attempt. The descriptive fields are fixed at Init; everything
    // below `mutex` is guarded by it.
    struct UploadSession
    {
        UploadSession(std::string id, Identity owner_identity, std::string file_name, std::string file_extension,
                      std::string mime_type, std::string key, std::uint32_t chunks, std::uint32_t bytes_per_chunk);

        const std::string session_id;
        const Identity owner;
        const std::string filename;
        const std::string extension;
        const std::string content_type;
        const std::string storage_key;
        const std::uint32_t total_chunks;
        const std::uint32_t chunk_size;
        const std::chrono::system_clock::time_point created_at;

        mutable std::mutex mutex;
        UploadState state{UploadState::Initialized};
        std::vector<bool> received;
        std::uint32_t received_count{0};
        std::vector<std::string> chunk_digests;
        bool finalizing{false};
        std::optional<std::uint64_t> final_size;
        // Set on Complete; differs from `storage_key` when the store had to pick another name.
        std::optional<std::string> committed_key;
        std::chrono::system_clock::time_point updated_at;
        std::optional<std::chrono::system_clock::time_point> paused_at;

        // The helpers below expect `mutex` to be held by the caller.

        // Applies `event` through the transition table; false when the current state rejects it.
        bool apply(SessionEvent event);

        bool has_chunk(std::uint32_t index) const noexcept;
        void mark_received(std::uint32_t index, std::string digest);
        bool all_received() const noexcept { return received_count == total_chunks; }

        // Ascending complement of the received set in [0, total_chunks).
        std::vector<std::uint32_t> missing_chunks() const;
    };

} // namespace chunkvault::server
