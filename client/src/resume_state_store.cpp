#include "chunkvault/client/resume_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkvault::client
{

    ResumeStateStore::ResumeStateStore() : ResumeStateStore(default_state_path()) {}

    ResumeStateStore::ResumeStateStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<ResumeStateStore::Entry> ResumeStateStore::find(const std::string &server,
                                                                  const std::filesystem::path &local_path) const
    {
        const auto normalized = normalize_path(local_path);
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.server == server && entry.local_path == normalized; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<ResumeStateStore::Entry> ResumeStateStore::find_session(const std::string &session_id) const
    {
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.session_id == session_id; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void ResumeStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                               { return existing.server == entry.server && existing.local_path == entry.local_path; });
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            *it = std::move(entry);
        }
        save();
    }

    void ResumeStateStore::remove_session(const std::string &session_id)
    {
        const auto before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                      { return entry.session_id == session_id; }),
                       entries_.end());
        if (entries_.size() != before)
        {
            save();
        }
    }

    std::filesystem::path ResumeStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkvault" / "uploads.json";
        }
        return std::filesystem::path(".chunkvault") / "uploads.json";
    }

    void ResumeStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        // A corrupt state file only loses resume hints; start over rather than refuse to run.
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.server = item.value("server", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.session_id = item.value("session", std::string{});
            entry.chunk_size = item.value("chunk_size", 0U);
            entry.total_chunks = item.value("total_chunks", 0U);
            if (!entry.session_id.empty() && entry.chunk_size > 0)
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void ResumeStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"server", entry.server},
                            {"local", entry.local_path.generic_string()},
                            {"session", entry.session_id},
                            {"chunk_size", entry.chunk_size},
                            {"total_chunks", entry.total_chunks}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write resume state: " + state_path_.string());
        }
        out << json.dump(2);
    }

    std::filesystem::path ResumeStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace chunkvault::client
