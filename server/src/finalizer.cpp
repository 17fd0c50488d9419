#include "chunkvault/server/finalizer.hpp"

#include <array>
#include <exception>
#include <istream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <streambuf>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        // Streams the slots of one session back to back, opening one slot at a time.
        class SlotChainBuffer : public std::streambuf
        {
        public:
            SlotChainBuffer(const ChunkStaging &staging, std::string session_id, std::uint32_t total_chunks)
                : staging_(staging), session_id_(std::move(session_id)), total_chunks_(total_chunks) {}

            std::uint64_t bytes_read() const noexcept { return bytes_read_; }
            const std::optional<std::string> &error() const noexcept { return error_; }

        protected:
            int_type underflow() override
            {
                if (gptr() < egptr())
                {
                    return traits_type::to_int_type(*gptr());
                }
                while (next_index_ <= total_chunks_)
                {
                    if (current_)
                    {
                        current_->read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
                        const auto count = current_->gcount();
                        if (count > 0)
                        {
                            bytes_read_ += static_cast<std::uint64_t>(count);
                            setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
                            return traits_type::to_int_type(*gptr());
                        }
                        if (current_->bad())
                        {
                            fail("failed to read staged chunk " + std::to_string(next_index_ - 1));
                        }
                        current_.reset();
                    }
                    if (next_index_ == total_chunks_)
                    {
                        break;
                    }
                    try
                    {
                        current_.emplace(staging_.open(session_id_, next_index_));
                    }
                    catch (const std::exception &ex)
                    {
                        fail(ex.what());
                    }
                    ++next_index_;
                }
                return traits_type::eof();
            }

        private:
            [[noreturn]] void fail(std::string message)
            {
                error_ = message;
                // istream turns this into badbit, which the object store reports as a read failure.
                throw std::runtime_error(std::move(message));
            }

            static constexpr std::size_t kBufferSize = 64 * 1024;

            const ChunkStaging &staging_;
            std::string session_id_;
            std::uint32_t total_chunks_;
            std::uint32_t next_index_{0};
            std::optional<std::ifstream> current_;
            std::array<char, kBufferSize> buffer_{};
            std::uint64_t bytes_read_{0};
            std::optional<std::string> error_;
        };
    } // namespace

    Finalizer::Finalizer(const ChunkStaging &staging, ObjectStore &objects) : staging_(staging), objects_(objects) {}

    FinalizeResult Finalizer::finalize(UploadSession &session)
    {
        SlotChainBuffer chain(staging_, session.session_id, session.total_chunks);
        std::istream stream(&chain);

        std::optional<CommitResult> committed;
        std::string failure;
        try
        {
            committed = objects_.commit(stream, session.storage_key, session.content_type);
            if (chain.error())
            {
                failure = *chain.error();
                committed.reset();
            }
        }
        catch (const std::exception &ex)
        {
            // StorageError and anything else the store lets through leave the session retryable.
            failure = chain.error() ? *chain.error() : ex.what();
        }

        std::lock_guard lock(session.mutex);
        session.finalizing = false;

        if (!committed)
        {
            spdlog::error("Storage commit failed for session {}: {}", session.session_id, failure);
            if (session.state == UploadState::Cancelled)
            {
                staging_.release(session.session_id);
            }
            throw ProtocolError(ErrorCode::StorageCommitFailed, "storage commit failed: " + failure);
        }

        FinalizeResult result{committed->key, chain.bytes_read()};
        if (session.state == UploadState::Cancelled)
        {
            // Cancelled while committing: the object exists but the session stays cancelled.
            spdlog::warn("Session {} was cancelled during finalize; object {} was still stored",
                         session.session_id, result.storage_key);
        }
        else if (session.apply(SessionEvent::FinalizeSucceeded))
        {
            session.final_size = result.final_size;
            session.committed_key = result.storage_key;
            spdlog::info("Upload completed: session={} key={} size={}", session.session_id, result.storage_key,
                         result.final_size);
        }
        staging_.release(session.session_id);
        return result;
    }

} // namespace chunkvault::server
