#include "chunkvault/server/chunk_staging.hpp"

#include <cctype>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        // Session ids embed user ids from the token database; keep the directory name to a safe alphabet.
        std::string safe_component(const std::string &value)
        {
            std::string result = value;
            for (auto &ch : result)
            {
                const auto c = static_cast<unsigned char>(ch);
                if (!std::isalnum(c) && ch != '-' && ch != '_')
                {
                    ch = '_';
                }
            }
            return result.empty() ? std::string{"_"} : result;
        }
    } // namespace

    ChunkStaging::ChunkStaging(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    std::filesystem::path ChunkStaging::root() const
    {
        return root_;
    }

    std::filesystem::path ChunkStaging::session_dir(const std::string &session_id) const
    {
        return root_ / safe_component(session_id);
    }

    std::filesystem::path ChunkStaging::slot_path(const std::string &session_id, std::uint32_t index) const
    {
        return session_dir(session_id) / (std::to_string(index) + ".chunk");
    }

    void ChunkStaging::write(const std::string &session_id, std::uint32_t index,
                             std::span<const std::uint8_t> data) const
    {
        const auto target = slot_path(session_id, index);
        auto temp = target;
        temp += ".part";

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            throw ProtocolError(ErrorCode::StagingFailed, "failed to stage chunk: " + ec.message());
        }

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ProtocolError(ErrorCode::StagingFailed, "failed to stage chunk: cannot open slot");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                std::filesystem::remove(temp, ec);
                throw ProtocolError(ErrorCode::StagingFailed, "failed to stage chunk: write error");
            }
        }

        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw ProtocolError(ErrorCode::StagingFailed, "failed to stage chunk: " + ec.message());
        }
    }

    bool ChunkStaging::contains(const std::string &session_id, std::uint32_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(slot_path(session_id, index), ec);
    }

    std::ifstream ChunkStaging::open(const std::string &session_id, std::uint32_t index) const
    {
        std::ifstream in(slot_path(session_id, index), std::ios::binary);
        if (!in.is_open())
        {
            throw ProtocolError(ErrorCode::StagingFailed,
                                "staged chunk " + std::to_string(index) + " is missing");
        }
        return in;
    }

    void ChunkStaging::release(const std::string &session_id) const noexcept
    {
        std::error_code ec;
        std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            spdlog::error("Failed to release staging for session {}: {}", session_id, ec.message());
        }
    }

    bool ChunkStaging::has_session(const std::string &session_id) const
    {
        std::error_code ec;
        return std::filesystem::exists(session_dir(session_id), ec);
    }

} // namespace chunkvault::server
