#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::client
{

    // Remembers unfinished uploads so a later run can continue them with RESUME_UPLOAD.
    class ResumeStateStore
    {
    public:
        struct Entry
        {
            std::string server;
            std::filesystem::path local_path;
            std::string session_id;
            std::uint32_t chunk_size{};
            std::uint32_t total_chunks{};
        };

        ResumeStateStore();
        explicit ResumeStateStore(std::filesystem::path state_path);

        std::optional<Entry> find(const std::string &server, const std::filesystem::path &local_path) const;

        std::optional<Entry> find_session(const std::string &session_id) const;

        void upsert(Entry entry);

        void remove_session(const std::string &session_id);

        const std::filesystem::path &state_path() const { return state_path_; }

        static std::filesystem::path default_state_path();

    private:
        void load();
        void save() const;
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkvault::client
