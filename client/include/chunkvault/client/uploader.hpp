#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/resume_state_store.hpp"
#include "chunkvault/client/upload_client.hpp"

namespace chunkvault::client
{

    class UploadError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct UploadReport
    {
        std::string session_id;
        std::string storage_key;
        std::uint64_t final_size{};
        std::uint32_t chunks_sent{};
        bool resumed{false};
    };

    // Drives a whole file through INIT_UPLOAD / UPLOAD_CHUNK, continuing a remembered session when there is one.
    class Uploader
    {
    public:
        using ProgressCallback = std::function<void(std::uint32_t received, std::uint32_t total)>;

        Uploader(UploadClient &client, ResumeStateStore &state, Logger &logger, std::string server);

        void on_progress(ProgressCallback callback) { progress_ = std::move(callback); }

        // Throws UploadError when the server rejects the upload.
        UploadReport upload(const std::filesystem::path &file, std::uint32_t chunk_size);

        // Continues `session_id` with the missing chunks of `file`.
        UploadReport resume(const std::string &session_id, const std::filesystem::path &file,
                            std::uint32_t fallback_chunk_size);

    private:
        UploadReport start_new(const std::filesystem::path &file, std::uint32_t chunk_size);

        UploadReport send_chunks(const std::filesystem::path &file, const std::string &session_id,
                                 std::uint32_t chunk_size, std::uint32_t total_chunks,
                                 std::vector<std::uint32_t> indices);

        UploadClient &client_;
        ResumeStateStore &state_;
        Logger &logger_;
        std::string server_;
        ProgressCallback progress_;
    };

} // namespace chunkvault::client
