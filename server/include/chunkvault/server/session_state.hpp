/**
 * ChunkVault - Upload session state machine.
 *
 * Every state change goes through transition(), including the implicit
 * Paused -> Uploading move caused by a chunk arriving on a paused session.
 * Complete and Cancelled are terminal: no event leaves them.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkvault::server
{

    enum class UploadState : std::uint8_t
    {
        Initialized,
        Uploading,
        Paused,
        Complete,
        Cancelled
    };

    enum class SessionEvent : std::uint8_t
    {
        ChunkReceived,
        Pause,
        Resume,
        Cancel,
        FinalizeSucceeded
    };

    // Wire names reported by GET_STATUS.
    std::string_view to_string(UploadState state) noexcept;
    std::string_view to_string(SessionEvent event) noexcept;

    constexpr bool is_terminal(UploadState state) noexcept
    {
        return state == UploadState::Complete || state == UploadState::Cancelled;
    }

    // std::nullopt when the event is not accepted in `current`.
    std::optional<UploadState> transition(UploadState current, SessionEvent event) noexcept;

} // namespace chunkvault::server
