#include "chunkvault/client/uploader.hpp"

#include <fstream>
#include <limits>
#include <span>
#include <variant>

namespace chunkvault::client
{

    namespace
    {
        [[noreturn]] void fail_with(const protocol::Response &response, const std::string &context)
        {
            if (const auto *error = std::get_if<protocol::ErrorResponse>(&response))
            {
                throw UploadError(context + ": " + error->message);
            }
            if (std::holds_alternative<protocol::AuthFailedResponse>(response))
            {
                throw UploadError(context + ": authentication failed");
            }
            throw UploadError(context + ": unexpected response " + describe(response));
        }

        std::uint32_t chunk_count(std::uint64_t file_size, std::uint32_t chunk_size)
        {
            const auto count = (file_size + chunk_size - 1) / chunk_size;
            if (count > std::numeric_limits<std::uint32_t>::max())
            {
                throw UploadError("file needs too many chunks; use a larger --chunk-size");
            }
            return static_cast<std::uint32_t>(count);
        }
    } // namespace

    Uploader::Uploader(UploadClient &client, ResumeStateStore &state, Logger &logger, std::string server)
        : client_(client), state_(state), logger_(logger), server_(std::move(server)) {}

    UploadReport Uploader::upload(const std::filesystem::path &file, std::uint32_t chunk_size)
    {
        if (!std::filesystem::is_regular_file(file))
        {
            throw UploadError("Local file does not exist: " + file.string());
        }

        if (const auto entry = state_.find(server_, file))
        {
            logger_.info("upload", "found unfinished session ", entry->session_id, " for ", file.string());
            auto response = client_.resume(entry->session_id);
            if (std::holds_alternative<protocol::ResumedResponse>(response))
            {
                return resume(entry->session_id, file, entry->chunk_size);
            }
            // The server no longer knows the session (expired or cancelled): start over.
            logger_.warn("upload", "cannot resume ", entry->session_id, ": ", describe(response));
            state_.remove_session(entry->session_id);
        }
        return start_new(file, chunk_size);
    }

    UploadReport Uploader::start_new(const std::filesystem::path &file, std::uint32_t chunk_size)
    {
        const auto file_size = std::filesystem::file_size(file);
        if (file_size == 0)
        {
            throw UploadError("Cannot upload an empty file");
        }
        const auto total = chunk_count(file_size, chunk_size);

        auto response = client_.init_upload(file.filename().string(), total, chunk_size);
        const auto *ready = std::get_if<protocol::ReadyResponse>(&response);
        if (!ready)
        {
            fail_with(response, "INIT_UPLOAD rejected");
        }
        logger_.info("upload", "session ", ready->session_id, " key ", ready->storage_key, " chunks ", total);

        state_.upsert(ResumeStateStore::Entry{
            .server = server_,
            .local_path = file,
            .session_id = ready->session_id,
            .chunk_size = chunk_size,
            .total_chunks = total,
        });

        std::vector<std::uint32_t> indices(total);
        for (std::uint32_t i = 0; i < total; ++i)
        {
            indices[i] = i;
        }
        return send_chunks(file, ready->session_id, chunk_size, total, std::move(indices));
    }

    UploadReport Uploader::resume(const std::string &session_id, const std::filesystem::path &file,
                                  std::uint32_t fallback_chunk_size)
    {
        if (!std::filesystem::is_regular_file(file))
        {
            throw UploadError("Local file does not exist: " + file.string());
        }
        const auto remembered = state_.find_session(session_id);
        const auto chunk_size = remembered ? remembered->chunk_size : fallback_chunk_size;

        // RESUME_UPLOAD is idempotent, so a second call after upload() probed the session is harmless.
        auto response = client_.resume(session_id);
        const auto *resumed = std::get_if<protocol::ResumedResponse>(&response);
        if (!resumed)
        {
            fail_with(response, "RESUME_UPLOAD rejected");
        }
        if (chunk_count(std::filesystem::file_size(file), chunk_size) != resumed->total_chunks)
        {
            throw UploadError("Local file does not match session " + session_id + " (chunk count differs)");
        }
        logger_.info("resume", "session ", session_id, " missing ", resumed->missing_chunks.size(), " of ",
                     resumed->total_chunks);

        auto indices = resumed->missing_chunks;
        if (indices.empty())
        {
            // Every chunk arrived but the commit failed; resending one re-runs finalize.
            indices.push_back(resumed->total_chunks - 1);
        }
        auto report = send_chunks(file, session_id, chunk_size, resumed->total_chunks, std::move(indices));
        report.resumed = true;
        return report;
    }

    UploadReport Uploader::send_chunks(const std::filesystem::path &file, const std::string &session_id,
                                       std::uint32_t chunk_size, std::uint32_t total_chunks,
                                       std::vector<std::uint32_t> indices)
    {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError("Could not open local file for reading: " + file.string());
        }

        UploadReport report;
        report.session_id = session_id;
        std::vector<std::uint8_t> buffer(chunk_size);

        for (const auto index : indices)
        {
            in.clear();
            in.seekg(static_cast<std::streamoff>(index) * chunk_size);
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                throw UploadError("Local file is shorter than expected at chunk " + std::to_string(index));
            }

            auto response = client_.upload_chunk(session_id, index, std::span(buffer.data(), read_count));
            ++report.chunks_sent;

            if (const auto *ack = std::get_if<protocol::ChunkAckResponse>(&response))
            {
                if (progress_)
                {
                    progress_(ack->received_count, ack->total_chunks);
                }
                continue;
            }
            if (const auto *duplicate = std::get_if<protocol::DuplicateResponse>(&response))
            {
                logger_.info("upload", "chunk ", duplicate->chunk_index, " already stored");
                continue;
            }
            if (const auto *complete = std::get_if<protocol::CompleteResponse>(&response))
            {
                if (progress_)
                {
                    progress_(total_chunks, total_chunks);
                }
                state_.remove_session(session_id);
                report.storage_key = complete->storage_key;
                report.final_size = complete->final_size;
                logger_.info("upload", "complete ", complete->storage_key, " (", complete->final_size, " bytes)");
                return report;
            }
            fail_with(response, "UPLOAD_CHUNK " + std::to_string(index) + " rejected");
        }

        throw UploadError("Server did not report completion for session " + session_id);
    }

} // namespace chunkvault::client
