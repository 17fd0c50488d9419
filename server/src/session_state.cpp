#include "chunkvault/server/session_state.hpp"

#include <array>

namespace chunkvault::server
{

    namespace
    {
        struct Transition
        {
            UploadState from;
            SessionEvent event;
            UploadState to;
        };

        constexpr std::array<Transition, 14> kTransitions{{
            {UploadState::Initialized, SessionEvent::ChunkReceived, UploadState::Uploading},
            {UploadState::Initialized, SessionEvent::Pause, UploadState::Paused},
            {UploadState::Initialized, SessionEvent::Cancel, UploadState::Cancelled},
            {UploadState::Initialized, SessionEvent::FinalizeSucceeded, UploadState::Complete},

            {UploadState::Uploading, SessionEvent::ChunkReceived, UploadState::Uploading},
            {UploadState::Uploading, SessionEvent::Pause, UploadState::Paused},
            {UploadState::Uploading, SessionEvent::Resume, UploadState::Uploading},
            {UploadState::Uploading, SessionEvent::Cancel, UploadState::Cancelled},
            {UploadState::Uploading, SessionEvent::FinalizeSucceeded, UploadState::Complete},

            // A chunk on a paused session is evidence the client resumed.
            {UploadState::Paused, SessionEvent::ChunkReceived, UploadState::Uploading},
            {UploadState::Paused, SessionEvent::Pause, UploadState::Paused},
            {UploadState::Paused, SessionEvent::Resume, UploadState::Uploading},
            {UploadState::Paused, SessionEvent::Cancel, UploadState::Cancelled},
            {UploadState::Paused, SessionEvent::FinalizeSucceeded, UploadState::Complete},
        }};

        struct StateName
        {
            UploadState state;
            std::string_view label;
        };

        constexpr std::array<StateName, 5> kStateNames{{
            {UploadState::Initialized, "initialized"},
            {UploadState::Uploading, "uploading"},
            {UploadState::Paused, "paused"},
            {UploadState::Complete, "completed"},
            {UploadState::Cancelled, "cancelled"},
        }};

        struct EventName
        {
            SessionEvent event;
            std::string_view label;
        };

        constexpr std::array<EventName, 5> kEventNames{{
            {SessionEvent::ChunkReceived, "chunk_received"},
            {SessionEvent::Pause, "pause"},
            {SessionEvent::Resume, "resume"},
            {SessionEvent::Cancel, "cancel"},
            {SessionEvent::FinalizeSucceeded, "finalize_succeeded"},
        }};
    } // namespace

    std::string_view to_string(UploadState state) noexcept
    {
        for (const auto &entry : kStateNames)
        {
            if (entry.state == state)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(SessionEvent event) noexcept
    {
        for (const auto &entry : kEventNames)
        {
            if (entry.event == event)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadState> transition(UploadState current, SessionEvent event) noexcept
    {
        for (const auto &entry : kTransitions)
        {
            if (entry.from == current && entry.event == event)
            {
                return entry.to;
            }
        }
        return std::nullopt;
    }

} // namespace chunkvault::server
