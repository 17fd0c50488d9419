#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>

namespace chunkvault::server
{

    // On-disk chunk slots: <root>/<session>/<index>.chunk, one file per received chunk.
    class ChunkStaging
    {
    public:
        explicit ChunkStaging(std::filesystem::path root);

        std::filesystem::path root() const;

        // Writes via a temporary file renamed into place. Throws ProtocolError(StagingFailed).
        void write(const std::string &session_id, std::uint32_t index, std::span<const std::uint8_t> data) const;

        bool contains(const std::string &session_id, std::uint32_t index) const;

        // Throws ProtocolError(StagingFailed) when the slot is missing.
        std::ifstream open(const std::string &session_id, std::uint32_t index) const;

        // Drops every slot of the session. Failures are logged, not thrown.
        void release(const std::string &session_id) const noexcept;

        bool has_session(const std::string &session_id) const;

    private:
        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path slot_path(const std::string &session_id, std::uint32_t index) const;

        std::filesystem::path root_;
    };

} // namespace chunkvault::server
